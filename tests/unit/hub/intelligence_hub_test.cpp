#include "../../common/hub_test_fixture.h"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_future.hpp>

#include <future>
#include <mutex>
#include <set>

using namespace titan;
using namespace titan::hub;
using namespace titan::hub::test;

namespace {

class FakeRenderTarget : public IRenderTarget {
public:
    std::optional<std::string> currentUrl() const override { return "https://example.test/"; }
    std::string title() const override { return "Example"; }
};

} // namespace

class IntelligenceHubTest : public HubTestBase {
protected:
    std::string runCommand(IntelligenceHub& hub, const std::string& tab,
                           const std::string& command) {
        auto reply = boost::asio::co_spawn(io_->get_executor(), hub.executeCommand(tab, command),
                                           boost::asio::use_future);
        if (reply.wait_for(5s) != std::future_status::ready) {
            return "<timeout>";
        }
        return reply.get();
    }
};

TEST_F(IntelligenceHubTest, CriticalTaskCompletesImmediately) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security,
                                                   immediateHandler({{"threatScore", 5}})));
    hub.start();

    auto id = hub.queueTask(makeTask("tab1_scan", Capability::Security, TaskPriority::Critical));
    ASSERT_TRUE(id);
    EXPECT_EQ(id.value(), "tab1_scan");
    ASSERT_TRUE(waitForStatus("tab1_scan", TaskStatus::Completed));

    auto task = hub.getTask("tab1_scan");
    ASSERT_TRUE(task->startedAt);
    ASSERT_TRUE(task->completedAt);
    EXPECT_LE(*task->startedAt, *task->completedAt);
    EXPECT_LT(*task->startedAt - task->createdAt, 1s);
    EXPECT_DOUBLE_EQ(task->progress, 1.0);
    EXPECT_EQ(task->result["threatScore"], 5);
    EXPECT_EQ(hub.statistics().completed, 1u);
}

TEST_F(IntelligenceHubTest, ConcurrencyCapHoldsSixthTask) {
    auto& hub = makeHub();
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Automation, gatedHandler(gate)));

    std::mutex mutex;
    std::set<std::string> running;
    std::size_t maxRunning = 0;
    hub.subscribeTaskUpdates("tab1", [&](const IntelligenceTask& t) {
        std::lock_guard<std::mutex> lock(mutex);
        if (t.status == TaskStatus::Running) {
            running.insert(t.id);
        } else if (isTerminal(t.status)) {
            running.erase(t.id);
        }
        maxRunning = std::max(maxRunning, running.size());
    });
    hub.start();

    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(hub.queueTask(
            makeTask("tab1_job" + std::to_string(i), Capability::Automation, TaskPriority::High)));
    }
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 5; }));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(gate->entered.load(), 5);
    EXPECT_EQ(hub.getTask("tab1_job5")->status, TaskStatus::Pending);

    gate->open = true;
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(waitForStatus("tab1_job" + std::to_string(i), TaskStatus::Completed));
    }
    EXPECT_LE(gate->maxActive.load(), 5);
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_LE(maxRunning, 5u);
}

TEST_F(IntelligenceHubTest, StuckTaskTimesOutAndFreesItsSlot) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.configure([] {
        IntelligenceConfigUpdate update;
        update.maxConcurrentTasks = 1;
        return update;
    }()));
    auto stuck = std::make_shared<Gate>();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Automation, stubbornHandler(stuck)));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security, immediateHandler()));
    hub.start();

    ASSERT_TRUE(hub.queueTask(
        makeTask("tab1_hang", Capability::Automation, TaskPriority::High, 1000ms)));
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_next", Capability::Security, TaskPriority::Low)));
    ASSERT_TRUE(waitFor([&] { return stuck->entered.load() == 1; }));

    ASSERT_TRUE(waitForStatus("tab1_hang", TaskStatus::Cancelled, 4s));
    auto hung = hub.getTask("tab1_hang");
    EXPECT_EQ(hung->error.value_or(""), "Task timeout");
    EXPECT_GE(*hung->completedAt - *hung->startedAt, 2s);

    // The slot is back although the handler is still running.
    ASSERT_TRUE(waitForStatus("tab1_next", TaskStatus::Completed));
    EXPECT_EQ(stuck->returned.load(), 0);
    EXPECT_EQ(hub.statistics().timedOut, 1u);

    stuck->open = true;
    ASSERT_TRUE(waitFor([&] { return stuck->returned.load() == 1; }));
    std::this_thread::sleep_for(20ms);
    hung = hub.getTask("tab1_hang");
    EXPECT_EQ(hung->status, TaskStatus::Cancelled);
    EXPECT_FALSE(hung->result.contains("late"));
}

TEST_F(IntelligenceHubTest, SlowPageProducesPerformanceInsight) {
    auto& hub = makeHub();
    std::vector<IntelligenceInsight> received;
    std::mutex mutex;
    hub.subscribeInsights([&](const IntelligenceInsight& insight) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(insight);
    });
    ASSERT_TRUE(hub.capabilities().registerHandler(
        Capability::Performance, immediateHandler({{"coreWebVitalsScore", 0.5}})));
    hub.start();

    ASSERT_TRUE(hub.queueTask(makeTask("tab1_perf", Capability::Performance)));
    ASSERT_TRUE(waitForStatus("tab1_perf", TaskStatus::Completed));
    ASSERT_TRUE(waitFor([&] { return hub.getInsights().size() == 1; }));

    auto insights = hub.getInsights(Capability::Performance);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 0.9);
    EXPECT_TRUE(hub.getInsights(Capability::Security).empty());
    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received.size(), 1u);
}

TEST_F(IntelligenceHubTest, CancelledPendingTaskNeverRuns) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.configure([] {
        IntelligenceConfigUpdate update;
        update.maxConcurrentTasks = 1;
        return update;
    }()));
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Automation, gatedHandler(gate)));
    hub.start();

    ASSERT_TRUE(hub.queueTask(makeTask("tab1_first", Capability::Automation)));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_second", Capability::Automation)));

    EXPECT_TRUE(hub.cancelTask("tab1_second"));
    EXPECT_FALSE(hub.cancelTask("tab1_second"));
    EXPECT_FALSE(hub.cancelTask("tab1_first"));
    auto second = hub.getTask("tab1_second");
    EXPECT_EQ(second->status, TaskStatus::Cancelled);
    EXPECT_EQ(second->startedAt, second->completedAt);

    gate->open = true;
    ASSERT_TRUE(waitForStatus("tab1_first", TaskStatus::Completed));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(gate->entered.load(), 1);
    EXPECT_EQ(hub.statistics().cancelled, 1u);
}

TEST_F(IntelligenceHubTest, DisabledCapabilityIsRejectedAndNotStored) {
    auto& hub = makeHub();
    auto res = hub.queueTask(makeTask("tab1_learn", Capability::Learning));
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, ErrorCode::CapabilityDisabled);
    EXPECT_FALSE(hub.getTask("tab1_learn"));

    ASSERT_TRUE(hub.setCapabilityEnabled(Capability::Learning, true));
    EXPECT_TRUE(hub.queueTask(makeTask("tab1_learn", Capability::Learning)));
}

TEST_F(IntelligenceHubTest, QueueValidation) {
    auto& hub = makeHub();
    EXPECT_EQ(hub.queueTask(makeTask("", Capability::Security)).error().code,
              ErrorCode::InvalidArgument);
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_dup", Capability::Security)));
    EXPECT_EQ(hub.queueTask(makeTask("tab1_dup", Capability::Security)).error().code,
              ErrorCode::InvalidState);
}

TEST_F(IntelligenceHubTest, HandlerFailureDoesNotAffectOtherTasks) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security,
                                                   failingHandler("scanner offline")));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Performance, immediateHandler()));
    hub.start();

    ASSERT_TRUE(hub.queueTask(makeTask("tab1_sec", Capability::Security)));
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_perf", Capability::Performance)));
    ASSERT_TRUE(waitForStatus("tab1_sec", TaskStatus::Failed));
    ASSERT_TRUE(waitForStatus("tab1_perf", TaskStatus::Completed));
    EXPECT_EQ(hub.getTask("tab1_sec")->error.value_or(""), "scanner offline");

    auto stats = hub.statistics();
    EXPECT_EQ(stats.completed, 1u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_DOUBLE_EQ(stats.successRate(), 0.5);
}

TEST_F(IntelligenceHubTest, RegisterTabQueuesInitialTasks) {
    auto& hub = makeHub();
    auto tasks = hub.registerTab("tab1", std::make_shared<FakeRenderTarget>());
    ASSERT_TRUE(tasks);
    ASSERT_EQ(tasks.value().size(), 3u);
    EXPECT_EQ(tasks.value()[0], "tab1_initial_analysis");
    EXPECT_EQ(tasks.value()[1], "tab1_security_scan");
    EXPECT_EQ(tasks.value()[2], "tab1_performance_analysis");

    auto scan = hub.getTask("tab1_security_scan");
    ASSERT_TRUE(scan);
    EXPECT_EQ(scan->name, "Security Scan");
    EXPECT_EQ(scan->priority, TaskPriority::High);
    EXPECT_EQ(scan->estimatedDuration, std::optional<std::chrono::milliseconds>(3000ms));
    EXPECT_EQ(hub.getActiveTasks(std::string("tab1")).size(), 3u);
    EXPECT_EQ(hub.registeredTabs(), std::vector<std::string>{"tab1"});

    ASSERT_TRUE(hub.setCapabilityEnabled(Capability::Security, false));
    auto second = hub.registerTab("tab2", nullptr);
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().size(), 2u);
    EXPECT_FALSE(hub.getTask("tab2_security_scan"));

    EXPECT_EQ(hub.registerTab("bad_tab", nullptr).error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(hub.registerTab("", nullptr).error().code, ErrorCode::InvalidArgument);
}

TEST_F(IntelligenceHubTest, HandlersSeeTheTabRenderTarget) {
    auto& hub = makeHub();
    std::promise<std::string> seen;
    auto future = seen.get_future();
    ASSERT_TRUE(hub.capabilities().registerHandler(
        Capability::WebAnalysis,
        [&seen](TaskContext ctx) -> boost::asio::awaitable<nlohmann::json> {
            seen.set_value(ctx.renderTarget ? ctx.renderTarget->currentUrl().value_or("")
                                            : "<none>");
            co_return nlohmann::json::object();
        }));
    ASSERT_TRUE(hub.setCapabilityEnabled(Capability::Security, false));
    ASSERT_TRUE(hub.setCapabilityEnabled(Capability::Performance, false));
    hub.start();

    ASSERT_TRUE(hub.registerTab("tab1", std::make_shared<FakeRenderTarget>()));
    ASSERT_EQ(future.wait_for(3s), std::future_status::ready);
    EXPECT_EQ(future.get(), "https://example.test/");
}

TEST_F(IntelligenceHubTest, UnregisterTabCancelsItsTasks) {
    auto& hub = makeHub();
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::WebAnalysis, gatedHandler(gate)));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security, gatedHandler(gate)));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Performance, gatedHandler(gate)));

    std::mutex mutex;
    std::vector<IntelligenceTask> cancelled;
    hub.subscribeTaskUpdates("tab1", [&](const IntelligenceTask& t) {
        if (t.status == TaskStatus::Cancelled) {
            std::lock_guard<std::mutex> lock(mutex);
            cancelled.push_back(t);
        }
    });
    hub.start();

    ASSERT_TRUE(hub.registerTab("tab1", nullptr));
    ASSERT_TRUE(hub.registerTab("tab2", nullptr));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 5; }));

    auto res = hub.unregisterTab("tab1");
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value(), 3u);
    for (const auto* id :
         {"tab1_initial_analysis", "tab1_security_scan", "tab1_performance_analysis"}) {
        auto task = hub.getTask(id);
        ASSERT_TRUE(task) << id;
        EXPECT_EQ(task->status, TaskStatus::Cancelled) << id;
    }
    ASSERT_TRUE(waitFor([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return cancelled.size() == 3;
    }));
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& t : cancelled) {
            if (t.startedAt != t.completedAt) {
                EXPECT_EQ(t.error.value_or(""), "Tab closed");
            }
        }
    }

    // tab2 keeps running
    EXPECT_EQ(hub.getTask("tab2_security_scan")->status, TaskStatus::Running);
    EXPECT_EQ(hub.registeredTabs(), std::vector<std::string>{"tab2"});
    EXPECT_EQ(hub.unregisterTab("tab1").error().code, ErrorCode::NotFound);
    gate->open = true;
}

TEST_F(IntelligenceHubTest, RepeatedQueriesAreStable) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.registerTab("tab1", nullptr));
    nlohmann::json first = hub.getActiveTasks();
    nlohmann::json second = hub.getActiveTasks();
    EXPECT_EQ(first, second);
    EXPECT_EQ(hub.getIntelligenceStats(), hub.getIntelligenceStats());
}

TEST_F(IntelligenceHubTest, ExecuteCommandReportsOutcome) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.capabilities().registerHandler(
        Capability::Performance, immediateHandler({{"message", "Images compressed"}})));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Automation,
                                                   failingHandler("element not found")));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::AiInteraction, immediateHandler()));
    hub.start();

    EXPECT_EQ(runCommand(hub, "tab1", "optimize images"),
              "Command executed successfully: Images compressed");
    EXPECT_EQ(runCommand(hub, "tab1", "click the buy button"),
              "Command failed: element not found");
    EXPECT_EQ(runCommand(hub, "tab1", "what is this page about?"),
              "Command executed successfully: Done");
    EXPECT_EQ(runCommand(hub, "", "optimize"),
              "Error processing command: Tab id must not be empty");
}

TEST_F(IntelligenceHubTest, ExecuteCommandResumesOnTaskUpdate) {
    auto& hub = makeHub();
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Performance, gatedHandler(gate)));
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Automation, gatedHandler(gate)));
    hub.start();

    auto reply = boost::asio::co_spawn(io_->get_executor(),
                                       hub.executeCommand("tab1", "optimize images"),
                                       boost::asio::use_future);
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));
    EXPECT_EQ(reply.wait_for(50ms), std::future_status::timeout);
    gate->open = true;
    ASSERT_EQ(reply.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(reply.get(), "Command executed successfully: Done");

    gate->open = false;
    auto closed = boost::asio::co_spawn(io_->get_executor(),
                                        hub.executeCommand("tab2", "click the buy button"),
                                        boost::asio::use_future);
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 2; }));
    ASSERT_TRUE(hub.unregisterTab("tab2"));
    ASSERT_EQ(closed.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(closed.get(), "Command failed: Tab closed");
}

TEST_F(IntelligenceHubTest, ProcessCommandQueuesHighPriorityTask) {
    auto& hub = makeHub();
    auto id = hub.processCommand("tab3", "is this site secure?");
    ASSERT_TRUE(id);
    auto task = hub.getTask(id.value());
    ASSERT_TRUE(task);
    EXPECT_EQ(task->capability, Capability::Security);
    EXPECT_EQ(task->priority, TaskPriority::High);
    EXPECT_EQ(task->name, "User Command");
    EXPECT_EQ(hub.processCommand("tab3", "").error().code, ErrorCode::InvalidArgument);
}

TEST_F(IntelligenceHubTest, AutoOptimizationQueuesPerTab) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.setCapabilityEnabled(Capability::WebAnalysis, false));
    ASSERT_TRUE(hub.setCapabilityEnabled(Capability::Security, false));
    ASSERT_TRUE(hub.registerTab("tab1", nullptr));
    ASSERT_TRUE(hub.registerTab("tab2", nullptr));

    EXPECT_EQ(hub.runAutoOptimization(), 2u);
    std::size_t found = 0;
    for (const auto& task : hub.getActiveTasks()) {
        if (task.id.find("_auto_optimization_") != std::string::npos) {
            EXPECT_EQ(task.priority, TaskPriority::Low);
            EXPECT_EQ(task.capability, Capability::Performance);
            ++found;
        }
    }
    EXPECT_EQ(found, 2u);

    IntelligenceConfigUpdate off;
    off.autoOptimization = false;
    ASSERT_TRUE(hub.configure(off));
    EXPECT_EQ(hub.runAutoOptimization(), 0u);
}

TEST_F(IntelligenceHubTest, ConfigurationPersistsAcrossInstances) {
    auto settings = std::make_shared<InMemorySettingsStore>();
    {
        auto& hub = makeHub(fastOptions(), settings);
        IntelligenceConfigUpdate update;
        update.maxConcurrentTasks = 2;
        update.confidenceThreshold = 0.95;
        ASSERT_TRUE(hub.configure(update));
        ASSERT_TRUE(hub.setCapabilityEnabled(Capability::Prediction, true));
    }
    auto& reopened = makeHub(fastOptions(), settings);
    auto config = reopened.configuration();
    EXPECT_EQ(config.maxConcurrentTasks, 2u);
    EXPECT_DOUBLE_EQ(config.confidenceThreshold, 0.95);
    EXPECT_TRUE(config.isEnabled(Capability::Prediction));

    // A raised threshold leaves the performance insight in place.
    ASSERT_TRUE(reopened.capabilities().registerHandler(
        Capability::Performance, immediateHandler({{"coreWebVitalsScore", 0.5}})));
    reopened.start();
    ASSERT_TRUE(reopened.queueTask(makeTask("tab1_perf", Capability::Performance)));
    ASSERT_TRUE(waitForStatus("tab1_perf", TaskStatus::Completed));
    ASSERT_TRUE(waitFor([&] { return reopened.getInsights().size() == 1; }));
    auto insights = reopened.getInsights(Capability::Performance);
    ASSERT_EQ(insights.size(), 1u);
    EXPECT_DOUBLE_EQ(insights[0].confidence, 0.9);
}

TEST_F(IntelligenceHubTest, StatsReportCountersAndConfiguration) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security, immediateHandler()));
    hub.start();
    ASSERT_TRUE(hub.registerTab("tab1", nullptr));
    ASSERT_TRUE(waitForStatus("tab1_security_scan", TaskStatus::Completed));
    ASSERT_TRUE(waitForStatus("tab1_initial_analysis", TaskStatus::Failed));

    auto stats = hub.getIntelligenceStats();
    EXPECT_EQ(stats["registeredTabs"], 1);
    EXPECT_EQ(stats["activeTasks"], 3);
    EXPECT_GE(stats["completedTasks"].get<int>(), 1);
    EXPECT_EQ(stats["capabilityUsage"]["security"], 1);
    EXPECT_EQ(stats["configuration"]["maxConcurrentTasks"], 5);
    EXPECT_TRUE(stats["enabledCapabilities"].is_array());
    EXPECT_TRUE(stats.contains("successRate"));
    EXPECT_TRUE(stats.contains("averageExecutionTime"));
}

TEST_F(IntelligenceHubTest, SweepPurgesExpiredTasks) {
    auto options = fastOptions();
    options.retention = 0ms;
    options.reaperInterval = std::chrono::hours(1);
    auto& hub = makeHub(options);
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security, immediateHandler()));
    hub.start();
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_quick", Capability::Security)));
    ASSERT_TRUE(waitForStatus("tab1_quick", TaskStatus::Completed));

    auto result = hub.sweepNow();
    EXPECT_EQ(result.purged, 1u);
    EXPECT_FALSE(hub.getTask("tab1_quick"));
}

TEST_F(IntelligenceHubTest, PendingTasksWaitForStart) {
    auto& hub = makeHub();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Security, immediateHandler()));
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_early", Capability::Security)));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(hub.getTask("tab1_early")->status, TaskStatus::Pending);

    hub.start();
    hub.start();
    EXPECT_TRUE(hub.isRunning());
    ASSERT_TRUE(waitForStatus("tab1_early", TaskStatus::Completed));
    hub.stop();
    hub.stop();
    EXPECT_FALSE(hub.isRunning());
}

TEST_F(IntelligenceHubTest, StopCancelsRunningTasks) {
    auto& hub = makeHub();
    auto gate = std::make_shared<Gate>();
    ASSERT_TRUE(hub.capabilities().registerHandler(Capability::Automation, gatedHandler(gate)));
    hub.start();
    ASSERT_TRUE(hub.queueTask(makeTask("tab1_long", Capability::Automation)));
    ASSERT_TRUE(waitFor([&] { return gate->entered.load() == 1; }));

    hub.stop();
    auto task = hub.getTask("tab1_long");
    EXPECT_EQ(task->status, TaskStatus::Cancelled);
    EXPECT_EQ(task->error.value_or(""), "Hub shutting down");
}

TEST_F(IntelligenceHubTest, RejectsNullExecutor) {
    EXPECT_THROW(IntelligenceHub(IntelligenceHub::Dependencies{}), std::invalid_argument);
}
