#include <gtest/gtest.h>

#include <titan/hub/components/TaskStore.h>

using namespace titan;
using namespace titan::hub;
using namespace std::chrono_literals;

namespace {

IntelligenceTask pending(const std::string& id, Capability cap = Capability::WebAnalysis) {
    IntelligenceTask task;
    task.id = id;
    task.capability = cap;
    task.createdAt = Clock::now();
    return task;
}

} // namespace

TEST(TaskStoreTest, InsertRejectsEmptyIdAndStartedTasks) {
    TaskStore store;
    auto res = store.insert(pending(""));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::InvalidArgument);

    auto started = pending("tab1_a");
    started.startedAt = Clock::now();
    EXPECT_FALSE(store.insert(started));

    auto running = pending("tab1_b");
    running.status = TaskStatus::Running;
    EXPECT_FALSE(store.insert(running));
    EXPECT_EQ(store.size(), 0u);
}

TEST(TaskStoreTest, DuplicateActiveIdRejectedTerminalReplaced) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));

    auto dup = store.insert(pending("tab1_a"));
    ASSERT_FALSE(dup);
    EXPECT_EQ(dup.error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(store.cancelPending("tab1_a", Clock::now()));
    ASSERT_TRUE(store.insert(pending("tab1_a", Capability::Security)));
    auto task = store.get("tab1_a");
    ASSERT_TRUE(task);
    EXPECT_EQ(task->status, TaskStatus::Pending);
    EXPECT_EQ(task->capability, Capability::Security);
    EXPECT_EQ(store.size(), 1u);
}

TEST(TaskStoreTest, RunningThenCompletedStampsAndMergesResult) {
    TaskStore store;
    auto fresh = pending("tab1_a");
    fresh.result = nlohmann::json::object();
    ASSERT_TRUE(store.insert(fresh));

    auto t0 = Clock::now();
    auto running = store.markRunning("tab1_a", t0);
    ASSERT_TRUE(running);
    EXPECT_EQ(running.value().status, TaskStatus::Running);
    ASSERT_TRUE(running.value().startedAt);
    EXPECT_FALSE(running.value().completedAt);

    auto done = store.markCompleted("tab1_a", {{"score", 0.5}, {"message", "ok"}}, t0 + 10ms);
    ASSERT_TRUE(done);
    const auto& task = done.value();
    EXPECT_EQ(task.status, TaskStatus::Completed);
    EXPECT_DOUBLE_EQ(task.progress, 1.0);
    ASSERT_TRUE(task.completedAt);
    EXPECT_EQ(*task.completedAt - *task.startedAt, 10ms);
    EXPECT_EQ(task.result["message"], "ok");
}

TEST(TaskStoreTest, NonObjectResultStoredUnderValue) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));
    ASSERT_TRUE(store.markRunning("tab1_a", Clock::now()));
    auto done = store.markCompleted("tab1_a", nlohmann::json(42), Clock::now());
    ASSERT_TRUE(done);
    EXPECT_EQ(done.value().result["value"], 42);
}

TEST(TaskStoreTest, FailedRecordsError) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));
    ASSERT_TRUE(store.markRunning("tab1_a", Clock::now()));
    auto failed = store.markFailed("tab1_a", "network down", Clock::now());
    ASSERT_TRUE(failed);
    EXPECT_EQ(failed.value().status, TaskStatus::Failed);
    EXPECT_EQ(failed.value().error, std::optional<std::string>("network down"));
    EXPECT_TRUE(failed.value().completedAt);
}

TEST(TaskStoreTest, CancelPendingStampsBothTimestamps) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));
    auto now = Clock::now();
    auto cancelled = store.cancelPending("tab1_a", now);
    ASSERT_TRUE(cancelled);
    EXPECT_EQ(cancelled.value().status, TaskStatus::Cancelled);
    EXPECT_EQ(cancelled.value().startedAt, std::optional<TimePoint>(now));
    EXPECT_EQ(cancelled.value().completedAt, std::optional<TimePoint>(now));
}

TEST(TaskStoreTest, CancelRunningKeepsStartAndSetsReason) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));
    auto t0 = Clock::now();
    ASSERT_TRUE(store.markRunning("tab1_a", t0));
    auto cancelled = store.cancelRunning("tab1_a", "Task timeout", t0 + 5s);
    ASSERT_TRUE(cancelled);
    EXPECT_EQ(cancelled.value().error, std::optional<std::string>("Task timeout"));
    EXPECT_EQ(cancelled.value().startedAt, std::optional<TimePoint>(t0));
    EXPECT_EQ(cancelled.value().completedAt, std::optional<TimePoint>(t0 + 5s));
}

TEST(TaskStoreTest, IllegalTransitionsAreRejected) {
    TaskStore store;
    EXPECT_EQ(store.markRunning("missing", Clock::now()).error().code, ErrorCode::NotFound);

    ASSERT_TRUE(store.insert(pending("tab1_a")));
    EXPECT_EQ(store.markCompleted("tab1_a", {}, Clock::now()).error().code,
              ErrorCode::InvalidState);
    EXPECT_EQ(store.cancelRunning("tab1_a", "x", Clock::now()).error().code,
              ErrorCode::InvalidState);

    ASSERT_TRUE(store.markRunning("tab1_a", Clock::now()));
    EXPECT_EQ(store.markRunning("tab1_a", Clock::now()).error().code, ErrorCode::InvalidState);
    EXPECT_EQ(store.cancelPending("tab1_a", Clock::now()).error().code, ErrorCode::InvalidState);

    ASSERT_TRUE(store.markCompleted("tab1_a", {}, Clock::now()));
    EXPECT_FALSE(store.markFailed("tab1_a", "late", Clock::now()));
    EXPECT_EQ(store.get("tab1_a")->status, TaskStatus::Completed);
}

TEST(TaskStoreTest, ProgressIsClampedAndMonotonic) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));
    EXPECT_FALSE(store.updateProgress("tab1_a", 0.5)); // still Pending

    ASSERT_TRUE(store.markRunning("tab1_a", Clock::now()));
    ASSERT_TRUE(store.updateProgress("tab1_a", 0.4));
    EXPECT_FALSE(store.updateProgress("tab1_a", 0.3));
    EXPECT_FALSE(store.updateProgress("tab1_a", 0.4));
    auto clamped = store.updateProgress("tab1_a", 7.0);
    ASSERT_TRUE(clamped);
    EXPECT_DOUBLE_EQ(clamped.value().progress, 1.0);
    EXPECT_DOUBLE_EQ(store.get("tab1_a")->progress, 1.0);
}

TEST(TaskStoreTest, ListPreservesAdmissionOrderAndFiltersByTab) {
    TaskStore store;
    for (const auto* id : {"tab2_z", "tab1_y", "tab2_a", "tab1_b"}) {
        ASSERT_TRUE(store.insert(pending(id)));
    }

    auto all = store.list();
    ASSERT_EQ(all.size(), 4u);
    EXPECT_EQ(all[0].id, "tab2_z");
    EXPECT_EQ(all[3].id, "tab1_b");

    auto tab2 = store.list(std::string("tab2"));
    ASSERT_EQ(tab2.size(), 2u);
    EXPECT_EQ(tab2[0].id, "tab2_z");
    EXPECT_EQ(tab2[1].id, "tab2_a");

    ASSERT_TRUE(store.markRunning("tab1_y", Clock::now()));
    EXPECT_EQ(store.countByStatus(TaskStatus::Running), 1u);
    EXPECT_EQ(store.listByStatus(TaskStatus::Pending).size(), 3u);
}

TEST(TaskStoreTest, PurgeRemovesOnlyExpiredTerminalTasks) {
    TaskStore store;
    auto t0 = Clock::now() - 10min;
    ASSERT_TRUE(store.insert(pending("tab1_old")));
    ASSERT_TRUE(store.insert(pending("tab1_recent")));
    ASSERT_TRUE(store.insert(pending("tab1_running")));
    ASSERT_TRUE(store.insert(pending("tab1_waiting")));

    ASSERT_TRUE(store.markRunning("tab1_old", t0));
    ASSERT_TRUE(store.markCompleted("tab1_old", {}, t0 + 1s));
    ASSERT_TRUE(store.markRunning("tab1_recent", Clock::now()));
    ASSERT_TRUE(store.markFailed("tab1_recent", "x", Clock::now()));
    ASSERT_TRUE(store.markRunning("tab1_running", t0));

    EXPECT_EQ(store.purgeTerminal(Clock::now() - 5min), 1u);
    EXPECT_FALSE(store.contains("tab1_old"));
    EXPECT_TRUE(store.contains("tab1_recent"));
    EXPECT_TRUE(store.contains("tab1_running"));
    EXPECT_TRUE(store.contains("tab1_waiting"));
}

TEST(TaskStoreTest, RepeatedQueriesAreIdentical) {
    TaskStore store;
    ASSERT_TRUE(store.insert(pending("tab1_a")));
    ASSERT_TRUE(store.insert(pending("tab1_b")));
    nlohmann::json first = store.list();
    nlohmann::json second = store.list();
    EXPECT_EQ(first, second);
}
