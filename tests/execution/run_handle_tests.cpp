/**
 * @file run_handle_tests.cpp
 * @brief RunHandle: thread lifecycle, concurrency guard and event stream.
 */
#include <gtest/gtest.h>
#include "stepflow/checkpoint/file_checkpoint_store.hpp"
#include "stepflow/checkpoint/memory_checkpoint_store.hpp"
#include "stepflow/common/graph_builder.hpp"
#include "stepflow/common/logging.hpp"
#include "stepflow/execution/node_context.hpp"
#include "stepflow/execution/run_handle.hpp"
#include "stepflow/state/reducer.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <thread>

#include <unistd.h>

using namespace stepflow;
namespace fs = std::filesystem;

// =============================================================================
// Test Helpers
// =============================================================================

namespace
{

/**
 * @brief Node bodies wait on this gate until the test opens it.
 */
class Gate
{
public:
    void wait_entered()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_entered; });
    }

    void enter_and_wait()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_entered = true;
        m_cv.notify_all();
        m_cv.wait(lock, [this] { return m_open; });
    }

    void open()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = true;
        m_cv.notify_all();
    }

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_entered{false};
    bool m_open{false};
};

/**
 * @brief greet -> END; writes "hello <name>" and emits a status event.
 */
std::shared_ptr<const CompiledGraph> greeting_graph(std::shared_ptr<Gate> gate = nullptr)
{
    StateSchema schema;
    schema.add_channel("name", reducers::replace(), "world")
        .add_channel("greeting", reducers::replace(), "");
    GraphBuilder builder{std::move(schema)};
    builder.add_node("greet", [gate](NodeContext& ctx) -> NodeResult
    {
        if (gate)
        {
            gate->enter_and_wait();
        }
        ctx.emit_status("greeting " + ctx.state()["name"].get<std::string>());
        return Update{{"greeting", "hello " + ctx.state()["name"].get<std::string>()}};
    });
    builder.add_edge(kStart, "greet").add_edge("greet", kEnd);
    return builder.build();
}

std::shared_ptr<const CompiledGraph> asking_graph()
{
    StateSchema schema;
    schema.add_channel("answer", reducers::replace(), nullptr);
    GraphBuilder builder{std::move(schema)};
    builder.add_node("ask", [](NodeContext& ctx) -> NodeResult
    {
        return Update{{"answer", ctx.interrupt(Value{{"question", "why?"}})}};
    });
    builder.add_edge(kStart, "ask").add_edge("ask", kEnd);
    return builder.build();
}

std::shared_ptr<const CompiledGraph> failing_graph()
{
    GraphBuilder builder{StateSchema{}};
    builder.add_node("fail", [](NodeContext&) -> NodeResult { return NodeError{"out of coffee"}; });
    builder.add_edge(kStart, "fail").add_edge("fail", kEnd);
    return builder.build();
}

std::vector<Value> wire_events(const std::vector<RunEvent>& events)
{
    std::vector<Value> wire;
    for (const auto& event : events)
    {
        wire.push_back(Value(event));
    }
    return wire;
}

} // namespace

class RunHandleTests : public ::testing::Test
{
protected:
    CheckpointStorePtr store = std::make_shared<MemoryCheckpointStore>();
};

// =============================================================================
// Thread lifecycle
// =============================================================================

TEST_F(RunHandleTests, InvokeNull_NoCheckpoint_FailsWithNoCheckpoint)
{
    RunHandle runs(greeting_graph(), store);
    RunResult result = runs.invoke(nullptr, "fresh");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->code, ErrorCode::NoCheckpoint);
    EXPECT_FALSE(runs.get_state("fresh").has_value());
}

TEST_F(RunHandleTests, InvokeNull_CompletedThread_ReturnsCompleted)
{
    RunHandle runs(greeting_graph(), store);
    RunResult first = runs.invoke(Value{{"name", "Ada"}}, "done");
    ASSERT_TRUE(first.completed());
    EXPECT_EQ(first.state["greeting"], "hello Ada");

    RunResult again = runs.invoke(nullptr, "done");
    ASSERT_TRUE(again.completed());
    EXPECT_EQ(again.supersteps_run, 0u);
    EXPECT_EQ(again.state, first.state);
    EXPECT_EQ(again.superstep, first.superstep);
}

TEST_F(RunHandleTests, InvalidThreadId_Rejected)
{
    RunHandle runs(greeting_graph(), store);
    RunResult result = runs.invoke(Value::object(), "../escape");
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->code, ErrorCode::InvalidThreadId);

    EXPECT_THROW(runs.get_state("bad id"), StepflowError);
    EXPECT_THROW(runs.delete_thread(""), StepflowError);
}

TEST_F(RunHandleTests, GetState_UnknownThread_ReturnsNullopt)
{
    RunHandle runs(greeting_graph(), store);
    EXPECT_FALSE(runs.get_state("unknown").has_value());
}

TEST_F(RunHandleTests, DeleteThread_RemovesCheckpoint)
{
    RunHandle runs(greeting_graph(), store);
    ASSERT_TRUE(runs.invoke(Value::object(), "gone").completed());
    ASSERT_TRUE(runs.get_state("gone").has_value());

    EXPECT_TRUE(runs.delete_thread("gone"));
    EXPECT_FALSE(runs.get_state("gone").has_value());
    EXPECT_FALSE(runs.delete_thread("gone"));
    EXPECT_EQ(runs.invoke(nullptr, "gone").error->code, ErrorCode::NoCheckpoint);
}

TEST_F(RunHandleTests, Cancel_IdleThread_ReturnsFalse)
{
    RunHandle runs(greeting_graph(), store);
    EXPECT_FALSE(runs.cancel("idle"));
    EXPECT_FALSE(runs.is_running("idle"));
}

TEST_F(RunHandleTests, LogLevel_AppliedOnlyWhenConfigured)
{
    const auto original = logger()->level();

    EngineConfig verbose;
    verbose.log_level = spdlog::level::debug;
    RunHandle first(greeting_graph(), store, verbose);
    EXPECT_EQ(logger()->level(), spdlog::level::debug);

    RunHandle second(greeting_graph(), store);
    EXPECT_EQ(logger()->level(), spdlog::level::debug);

    set_log_level(original);
}

TEST_F(RunHandleTests, ConfigConstructor_UsesFileBackend)
{
    fs::path dir = fs::temp_directory_path() / ("stepflow-run-handle-" + std::to_string(::getpid()));
    fs::remove_all(dir);

    EngineConfig config;
    config.checkpoint.backend = CheckpointBackend::File;
    config.checkpoint.directory = dir.string();
    {
        RunHandle runs(greeting_graph(), config);
        EXPECT_NE(std::dynamic_pointer_cast<FileCheckpointStore>(runs.store()), nullptr);
        ASSERT_TRUE(runs.invoke(Value{{"name", "disk"}}, "persisted").completed());
    }
    RunHandle reopened(greeting_graph(), config);
    auto checkpoint = reopened.get_state("persisted");
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ(checkpoint->state["greeting"], "hello disk");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

// =============================================================================
// One call per thread id
// =============================================================================

TEST_F(RunHandleTests, ConcurrentCallOnSameThread_FailsWithThreadBusy)
{
    auto gate = std::make_shared<Gate>();
    RunHandle runs(greeting_graph(gate), store);

    RunResult first;
    std::thread runner([&] { first = runs.invoke(Value::object(), "shared"); });
    gate->wait_entered();

    EXPECT_TRUE(runs.is_running("shared"));
    RunResult second = runs.invoke(Value::object(), "shared");
    EXPECT_TRUE(second.failed());
    EXPECT_EQ(second.error.value_or(ErrorInfo{}).code, ErrorCode::ThreadBusy);
    EXPECT_EQ(runs.resume("shared", "x").error.value_or(ErrorInfo{}).code, ErrorCode::ThreadBusy);
    EXPECT_THROW(runs.delete_thread("shared"), StepflowError);

    gate->open();
    runner.join();
    EXPECT_TRUE(first.completed());
    EXPECT_FALSE(runs.is_running("shared"));
}

TEST_F(RunHandleTests, DifferentThreads_RunIndependently)
{
    auto gate = std::make_shared<Gate>();
    StateSchema schema;
    schema.add_channel("visited", reducers::append(), Value::array());
    GraphBuilder builder{std::move(schema)};
    builder.add_node("visit", [gate](NodeContext& ctx) -> NodeResult
    {
        if (ctx.thread_id() == "slow")
        {
            gate->enter_and_wait();
        }
        return Update{{"visited", Value::array({ctx.thread_id()})}};
    });
    builder.add_edge(kStart, "visit").add_edge("visit", kEnd);
    RunHandle runs(builder.build(), store);

    RunResult slow;
    std::thread runner([&] { slow = runs.invoke(Value::object(), "slow"); });
    gate->wait_entered();

    RunResult fast = runs.invoke(Value::object(), "fast");
    EXPECT_TRUE(fast.completed()) << fast.summary();
    EXPECT_EQ(fast.state["visited"], Value::array({"fast"}));
    EXPECT_TRUE(runs.is_running("slow"));

    gate->open();
    runner.join();
    ASSERT_TRUE(slow.completed());
    EXPECT_EQ(slow.state["visited"], Value::array({"slow"}));
}

// =============================================================================
// Event stream
// =============================================================================

TEST_F(RunHandleTests, Events_StatusThenComplete)
{
    RunHandle runs(greeting_graph(), store);
    std::vector<RunEvent> events;
    RunResult result = runs.invoke(Value{{"name", "Ada"}}, "events",
                                   [&events](const RunEvent& event) { events.push_back(event); });
    ASSERT_TRUE(result.completed());

    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, EventType::Status);
    EXPECT_EQ(events[0].message, "greeting Ada");
    EXPECT_EQ(events[1].type, EventType::Complete);
    EXPECT_EQ(events[1].payload, result.state);

    std::vector<Value> wire = wire_events(events);
    EXPECT_EQ(wire[0], (Value{{"type", "status"}, {"message", "greeting Ada"}}));
    EXPECT_EQ(wire[1]["type"], "complete");
    EXPECT_EQ(wire[1]["result"]["greeting"], "hello Ada");
}

TEST_F(RunHandleTests, Events_InterruptCarriesPayload)
{
    RunHandle runs(asking_graph(), store);
    std::vector<RunEvent> events;
    RunResult result = runs.invoke(Value::object(), "asking",
                                   [&events](const RunEvent& event) { events.push_back(event); });
    ASSERT_TRUE(result.interrupted());

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::Interrupt);
    EXPECT_EQ(events[0].message, result.interrupt->id);
    EXPECT_EQ(Value(events[0]), (Value{{"type", "interrupt"}, {"payload", {{"question", "why?"}}}}));

    events.clear();
    RunResult resumed = runs.resume("asking", "because",
                                    [&events](const RunEvent& event) { events.push_back(event); });
    ASSERT_TRUE(resumed.completed());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].type, EventType::Complete);
    EXPECT_EQ(events[0].payload["answer"], "because");
}

TEST_F(RunHandleTests, Events_ErrorCarriesCode)
{
    RunHandle runs(failing_graph(), store);
    std::vector<RunEvent> events;
    RunResult result = runs.invoke(Value::object(), "failing",
                                   [&events](const RunEvent& event) { events.push_back(event); });
    ASSERT_TRUE(result.failed());
    EXPECT_EQ(result.error->node, "fail");

    ASSERT_EQ(events.size(), 1u);
    Value wire = events[0];
    EXPECT_EQ(wire["type"], "error");
    EXPECT_EQ(wire["code"], "node_execution_error");
    EXPECT_NE(wire["message"].get<std::string>().find("out of coffee"), std::string::npos);
}

TEST_F(RunHandleTests, Events_ThrowingSink_DoesNotAffectRun)
{
    RunHandle runs(greeting_graph(), store);
    size_t calls = 0;
    RunResult result = runs.invoke(Value::object(), "sink",
                                   [&calls](const RunEvent&)
                                   {
                                       ++calls;
                                       throw std::runtime_error("sink broke");
                                   });
    EXPECT_TRUE(result.completed());
    EXPECT_EQ(result.state["greeting"], "hello world");
    EXPECT_EQ(calls, 2u);
}

TEST_F(RunHandleTests, Events_SinkThrowingNonStandardType_DoesNotAffectRun)
{
    RunHandle runs(greeting_graph(), store);
    size_t calls = 0;
    RunResult result = runs.invoke(Value::object(), "odd-sink",
                                   [&calls](const RunEvent&)
                                   {
                                       ++calls;
                                       throw 42;
                                   });
    EXPECT_TRUE(result.completed());
    EXPECT_EQ(calls, 2u);
}

TEST_F(RunHandleTests, Events_BusyCallStillEmitsTerminalError)
{
    auto gate = std::make_shared<Gate>();
    RunHandle runs(greeting_graph(gate), store);

    std::thread runner([&] { runs.invoke(Value::object(), "busy"); });
    gate->wait_entered();

    std::vector<RunEvent> events;
    runs.invoke(Value::object(), "busy", [&events](const RunEvent& event) { events.push_back(event); });
    gate->open();
    runner.join();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(Value(events[0])["code"], "thread_busy");
}
