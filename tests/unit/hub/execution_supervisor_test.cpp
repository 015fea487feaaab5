#include "../../common/hub_test_fixture.h"

#include <titan/hub/components/ExecutionSupervisor.h>
#include <titan/hub/components/HubStatistics.h>
#include <titan/hub/components/InsightGenerator.h>
#include <titan/hub/components/NotificationHub.h>
#include <titan/hub/components/TaskStore.h>

#include <boost/asio/strand.hpp>

#include <mutex>
#include <set>

using namespace titan;
using namespace titan::hub;
using namespace titan::hub::test;

class ExecutionSupervisorTest : public HubTestBase {
protected:
    void SetUp() override {
        HubTestBase::SetUp();
        store_ = std::make_shared<TaskStore>();
        notifications_ = std::make_shared<NotificationHub>();
        insights_ = std::make_unique<InsightGenerator>(*notifications_);
        supervisor_ = std::make_unique<ExecutionSupervisor>(ExecutionSupervisor::Dependencies{
            boost::asio::make_strand(boost::asio::any_io_executor(io_->get_executor())),
            io_->get_executor(),
            store_,
            registry_,
            notifications_,
            statistics_,
            *insights_,
            [this](const std::string& tabId) -> std::shared_ptr<IRenderTarget> {
                lookedUp_.insert(tabId);
                return nullptr;
            }});
        supervisor_->setSlotReleaser([this](const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            released_.push_back(id);
        });
    }

    void TearDown() override {
        if (supervisor_) {
            supervisor_->shutdown("test teardown", 2s);
            supervisor_.reset();
        }
        HubTestBase::TearDown();
    }

    void admit(const std::string& id, Capability capability) {
        IntelligenceTask task;
        task.id = id;
        task.capability = capability;
        task.createdAt = Clock::now();
        ASSERT_TRUE(store_->insert(task));
    }

    std::size_t releasedCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return released_.size();
    }

    TaskStatus statusOf(const std::string& id) { return store_->get(id)->status; }

    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<NotificationHub> notifications_;
    CapabilityRegistry registry_;
    HubStatistics statistics_;
    std::unique_ptr<InsightGenerator> insights_;
    std::unique_ptr<ExecutionSupervisor> supervisor_;
    std::mutex mutex_;
    std::vector<std::string> released_;
    std::set<std::string> lookedUp_;
};

TEST_F(ExecutionSupervisorTest, CompletesAndReleasesSlot) {
    ASSERT_TRUE(registry_.registerHandler(Capability::Performance,
                                          immediateHandler({{"coreWebVitalsScore", 0.4}})));
    admit("tab1_perf", Capability::Performance);

    ASSERT_TRUE(supervisor_->launch("tab1_perf"));
    ASSERT_TRUE(waitFor([&] { return releasedCount() == 1; }));
    EXPECT_EQ(statusOf("tab1_perf"), TaskStatus::Completed);
    EXPECT_EQ(statistics_.snapshot().completed, 1u);
    EXPECT_EQ(insights_->insights(Capability::Performance).size(), 1u);
    EXPECT_EQ(supervisor_->inFlightCount(), 0u);
    EXPECT_EQ(lookedUp_.count("tab1"), 1u);
}

TEST_F(ExecutionSupervisorTest, HandlerExceptionFailsTask) {
    ASSERT_TRUE(registry_.registerHandler(Capability::Security, failingHandler("scanner crashed")));
    admit("tab1_sec", Capability::Security);

    ASSERT_TRUE(supervisor_->launch("tab1_sec"));
    ASSERT_TRUE(waitFor([&] { return releasedCount() == 1; }));
    auto task = store_->get("tab1_sec");
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->error.value_or(""), "scanner crashed");
    EXPECT_EQ(statistics_.snapshot().failed, 1u);
}

TEST_F(ExecutionSupervisorTest, MissingHandlerFailsTask) {
    admit("tab1_x", Capability::Collaboration);
    ASSERT_TRUE(supervisor_->launch("tab1_x"));
    ASSERT_TRUE(waitFor([&] { return releasedCount() == 1; }));
    auto task = store_->get("tab1_x");
    EXPECT_EQ(task->status, TaskStatus::Failed);
    EXPECT_EQ(task->error.value_or(""), "No handler registered for capability collaboration");
}

TEST_F(ExecutionSupervisorTest, LaunchDeclinesTasksThatAreNotPending) {
    admit("tab1_gone", Capability::Security);
    ASSERT_TRUE(store_->cancelPending("tab1_gone", Clock::now()));
    EXPECT_FALSE(supervisor_->launch("tab1_gone"));
    EXPECT_FALSE(supervisor_->launch("tab1_unknown"));
    EXPECT_EQ(releasedCount(), 0u);
}

TEST_F(ExecutionSupervisorTest, CancelRunningFreesSlotBeforeHandlerReturns) {
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(registry_.registerHandler(Capability::Automation, stubbornHandler(gate)));
    admit("tab1_slow", Capability::Automation);

    ASSERT_TRUE(supervisor_->launch("tab1_slow"));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));

    auto cancelled = supervisor_->cancelRunning("tab1_slow", "Task timeout");
    ASSERT_TRUE(cancelled);
    ASSERT_TRUE(waitFor([&] { return releasedCount() == 1; }));
    EXPECT_EQ(gate->returned.load(), 0);

    // The late result is discarded.
    gate->open = true;
    ASSERT_TRUE(waitFor([&] { return gate->returned.load() == 1; }));
    std::this_thread::sleep_for(20ms);
    auto task = store_->get("tab1_slow");
    EXPECT_EQ(task->status, TaskStatus::Cancelled);
    EXPECT_EQ(task->error.value_or(""), "Task timeout");
    EXPECT_FALSE(task->result.contains("late"));
    EXPECT_EQ(statistics_.snapshot().completed, 0u);
    EXPECT_EQ(releasedCount(), 1u);
}

// A cancel that reaches the store before the token (the launch race) must still
// let the invocation go when the next cancel arrives.
TEST_F(ExecutionSupervisorTest, CancelReachesInvocationAlreadyCancelledInStore) {
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(registry_.registerHandler(Capability::Automation, stubbornHandler(gate)));
    admit("tab1_raced", Capability::Automation);

    ASSERT_TRUE(supervisor_->launch("tab1_raced"));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));
    ASSERT_TRUE(store_->cancelRunning("tab1_raced", "Tab closed", Clock::now()));
    EXPECT_EQ(supervisor_->inFlightCount(), 1u);

    auto again = supervisor_->cancelRunning("tab1_raced", "Task timeout");
    EXPECT_FALSE(again);
    ASSERT_TRUE(waitFor([&] { return releasedCount() == 1; }));
    EXPECT_EQ(supervisor_->inFlightCount(), 0u);
    EXPECT_EQ(gate->returned.load(), 0);

    auto task = store_->get("tab1_raced");
    EXPECT_EQ(task->status, TaskStatus::Cancelled);
    EXPECT_EQ(task->error.value_or(""), "Tab closed");

    gate->open = true;
    ASSERT_TRUE(waitFor([&] { return gate->returned.load() == 1; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(statusOf("tab1_raced"), TaskStatus::Cancelled);
    EXPECT_EQ(releasedCount(), 1u);
}

TEST_F(ExecutionSupervisorTest, ShutdownDrainsInvocationAlreadyCancelledInStore) {
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(registry_.registerHandler(Capability::Automation, stubbornHandler(gate)));
    admit("tab1_raced", Capability::Automation);

    ASSERT_TRUE(supervisor_->launch("tab1_raced"));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));
    ASSERT_TRUE(store_->cancelRunning("tab1_raced", "Tab closed", Clock::now()));

    EXPECT_TRUE(supervisor_->shutdown("Hub shutting down", 2s));
    EXPECT_EQ(supervisor_->inFlightCount(), 0u);
    EXPECT_EQ(releasedCount(), 1u);
    EXPECT_EQ(store_->get("tab1_raced")->error.value_or(""), "Tab closed");
    gate->open = true;
    ASSERT_TRUE(waitFor([&] { return gate->returned.load() == 1; }));
}

TEST_F(ExecutionSupervisorTest, ProgressIsRecordedAndPublished) {
    std::atomic<int> updates{0};
    notifications_->subscribeTab("tab1", [&](const IntelligenceTask& t) {
        if (t.status == TaskStatus::Running && t.progress > 0.0) {
            updates.fetch_add(1);
        }
    });
    ASSERT_TRUE(registry_.registerHandler(
        Capability::WebAnalysis, [](TaskContext ctx) -> boost::asio::awaitable<nlohmann::json> {
            ctx.reportProgress(0.25);
            ctx.reportProgress(0.5);
            ctx.reportProgress(0.4); // ignored, not an increase
            co_await sleepFor(10ms);
            co_return nlohmann::json{{"ok", true}};
        }));
    admit("tab1_page", Capability::WebAnalysis);
    ASSERT_TRUE(supervisor_->launch("tab1_page"));
    ASSERT_TRUE(waitFor([&] { return releasedCount() == 1; }));
    EXPECT_TRUE(waitFor([&] { return updates.load() == 2; }));
    EXPECT_DOUBLE_EQ(store_->get("tab1_page")->progress, 1.0);
}

TEST_F(ExecutionSupervisorTest, ShutdownCancelsInFlightAndRefusesLaunches) {
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(registry_.registerHandler(Capability::Automation, gatedHandler(gate)));
    admit("tab1_a", Capability::Automation);
    admit("tab1_b", Capability::Automation);
    ASSERT_TRUE(supervisor_->launch("tab1_a"));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));

    EXPECT_TRUE(supervisor_->shutdown("Hub shutting down", 2s));
    EXPECT_EQ(store_->get("tab1_a")->error.value_or(""), "Hub shutting down");
    EXPECT_FALSE(supervisor_->launch("tab1_b"));
    EXPECT_EQ(statusOf("tab1_b"), TaskStatus::Pending);

    supervisor_->resume();
    gate->open = true;
    EXPECT_TRUE(supervisor_->launch("tab1_b"));
    EXPECT_TRUE(waitFor([&] { return statusOf("tab1_b") == TaskStatus::Completed; }));
}

TEST_F(ExecutionSupervisorTest, RejectsNullCollaborators) {
    EXPECT_THROW(ExecutionSupervisor(ExecutionSupervisor::Dependencies{
                     boost::asio::make_strand(boost::asio::any_io_executor(io_->get_executor())),
                     {},
                     nullptr,
                     registry_,
                     notifications_,
                     statistics_,
                     *insights_,
                     {}}),
                 std::invalid_argument);
}
