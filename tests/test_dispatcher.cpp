#include <gtest/gtest.h>
#include <cli/dispatcher.hpp>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

class DispatcherTest : public ::testing::Test {
protected:
    // Worker declared last so queued jobs finish before the dispatcher goes.
    Dispatcher dispatcher{worker};
    Worker worker;

    void SetUp() override {
        dispatcher.add_command("echo", [](const CommandLine& c) {
            return CommandResult::ok(c.rest);
        }, "Print text");
        dispatcher.add_command("boom", [](const CommandLine&) -> CommandResult {
            throw std::runtime_error("exploded");
        }, "Throw");
        dispatcher.add_async_command("count", [](const CommandLine& c, const Dispatcher::Emit& emit) {
            for (const auto& a : c.args) emit(OutputEvent::chunk(a));
            emit(OutputEvent::out("done"));
        }, "Emit each argument", "Remote");
        dispatcher.add_async_command("fail", [](const CommandLine&, const Dispatcher::Emit&) {
            throw std::runtime_error("worker exploded");
        }, "Throw on the worker", "Remote");
    }

    static std::vector<OutputEvent> drain(CommandTask& task) {
        std::vector<OutputEvent> events;
        OutputEvent ev;
        while (task.next(ev, 2s)) events.push_back(ev);
        return events;
    }
};

TEST_F(DispatcherTest, RunsSyncCommand) {
    auto r = dispatcher.execute("ECHO hello   world");
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.output, "hello   world");
}

TEST_F(DispatcherTest, EmptyLine) {
    auto r = dispatcher.execute("   ");
    EXPECT_FALSE(r.is_error);
    EXPECT_EQ(r.output, "");
}

TEST_F(DispatcherTest, UnknownCommand) {
    auto r = dispatcher.execute("frobnicate now");
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.output, "command not found: frobnicate. Type 'help' for available commands.");
}

TEST_F(DispatcherTest, HandlerExceptionBecomesError) {
    auto r = dispatcher.execute("boom");
    EXPECT_TRUE(r.is_error);
    EXPECT_EQ(r.output, "boom: exploded");
}

TEST_F(DispatcherTest, SyncCommandIsNotSubmitted) {
    EXPECT_FALSE(dispatcher.submit("echo hi").has_value());
    EXPECT_FALSE(dispatcher.execute_async("echo hi", nullptr, nullptr));
    EXPECT_TRUE(dispatcher.has_command("echo"));
    EXPECT_FALSE(dispatcher.is_async("echo"));
    EXPECT_TRUE(dispatcher.is_async("count"));
}

TEST_F(DispatcherTest, AsyncEventsArriveInOrder) {
    auto task = dispatcher.submit("count a b c");
    ASSERT_TRUE(task.has_value());

    auto events = drain(*task);
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].text, "a");
    EXPECT_TRUE(events[0].fragment);
    EXPECT_EQ(events[2].text, "c");
    EXPECT_EQ(events[3].text, "done");
    EXPECT_FALSE(events[3].fragment);
    EXPECT_TRUE(task->finished());
    EXPECT_FALSE(dispatcher.busy());
}

TEST_F(DispatcherTest, AsyncExceptionIsReported) {
    auto task = dispatcher.submit("fail");
    ASSERT_TRUE(task.has_value());
    auto events = drain(*task);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events[0].is_error);
    EXPECT_EQ(events[0].text, "fail: worker exploded");
    EXPECT_TRUE(task->wait_for(1s));
}

TEST_F(DispatcherTest, SecondAsyncCommandIsBusy) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    dispatcher.add_async_command("block", [gate](const CommandLine&, const Dispatcher::Emit& emit) {
        gate.wait();
        emit(OutputEvent::out("released"));
    }, "Wait for the test");

    auto first = dispatcher.submit("block");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(dispatcher.busy());

    std::vector<OutputEvent> rejected;
    int completions = 0;
    EXPECT_TRUE(dispatcher.execute_async("count x",
        [&](const OutputEvent& ev) { rejected.push_back(ev); },
        [&] { completions++; }));
    ASSERT_EQ(rejected.size(), 1u);
    EXPECT_EQ(rejected[0].kind, ErrorKind::BUSY);
    EXPECT_EQ(rejected[0].text, "another command is still executing");
    EXPECT_EQ(completions, 1);

    release.set_value();
    first->wait();
    auto events = drain(*first);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].text, "released");
    EXPECT_FALSE(dispatcher.busy());

    auto again = dispatcher.submit("count y");
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(drain(*again).size(), 2u);
}

TEST_F(DispatcherTest, CancelDropsEvents) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    dispatcher.add_async_command("slow", [gate](const CommandLine&, const Dispatcher::Emit& emit) {
        gate.wait();
        emit(OutputEvent::out("late"));
    }, "Wait for the test");

    auto task = dispatcher.submit("slow");
    ASSERT_TRUE(task.has_value());
    task->cancel();
    EXPECT_TRUE(task->cancelled());
    release.set_value();
    task->wait();

    OutputEvent ev;
    EXPECT_FALSE(task->next(ev, 10ms));
}

TEST_F(DispatcherTest, CancelWakesWaitingConsumer) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    dispatcher.add_async_command("slow", [gate](const CommandLine&, const Dispatcher::Emit&) {
        gate.wait();
    }, "Wait for the test");

    auto task = dispatcher.submit("slow");
    ASSERT_TRUE(task.has_value());

    CommandTask handle = *task;
    std::thread canceller([handle]() mutable {
        std::this_thread::sleep_for(50ms);
        handle.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    OutputEvent ev;
    EXPECT_FALSE(task->next(ev, 10s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    canceller.join();
    release.set_value();
    task->wait();
}

TEST_F(DispatcherTest, ExclusiveCommandIsBusyWhileAsyncRuns) {
    int staged = 0;
    dispatcher.add_command("stage", [&staged](const CommandLine&) {
        staged++;
        return CommandResult::ok("staged");
    }, "Change session state", "Session", true);

    std::promise<void> release;
    auto gate = release.get_future().share();
    dispatcher.add_async_command("block", [gate](const CommandLine&, const Dispatcher::Emit&) {
        gate.wait();
    }, "Wait for the test");

    auto first = dispatcher.submit("block");
    ASSERT_TRUE(first.has_value());

    auto rejected = dispatcher.execute("stage");
    EXPECT_TRUE(rejected.is_error);
    EXPECT_EQ(rejected.kind, ErrorKind::BUSY);
    EXPECT_EQ(rejected.output, "another command is still executing");
    EXPECT_EQ(staged, 0);

    // Other synchronous commands still run
    EXPECT_EQ(dispatcher.execute("echo hi").output, "hi");

    release.set_value();
    first->wait();
    EXPECT_EQ(dispatcher.execute("stage").output, "staged");
    EXPECT_EQ(staged, 1);
}

TEST_F(DispatcherTest, HelpListsGroups) {
    auto help = dispatcher.help_text();
    EXPECT_NE(help.find("General"), std::string::npos);
    EXPECT_NE(help.find("Remote"), std::string::npos);
    EXPECT_NE(help.find("Emit each argument"), std::string::npos);
    EXPECT_LT(help.find("General"), help.find("Remote"));
}
