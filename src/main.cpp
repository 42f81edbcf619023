#include "stepflow/common/engine_config.hpp"
#include "stepflow/common/graph_builder.hpp"
#include "stepflow/execution/node_context.hpp"
#include "stepflow/execution/run_handle.hpp"
#include "stepflow/state/reducer.hpp"
#include "stepflow/state/state_schema.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace
{

using namespace stepflow;

constexpr const char* kDefaultDirectory = ".stepflow-threads";

void print_usage()
{
    std::cout << "usage: stepflow_demo [--config <file>] <command> [args]\n"
              << "  start <thread> [topic]       draft a report and wait for review\n"
              << "  resume <thread> <response>   answer the review (\"approve\" or feedback)\n"
              << "  show <thread>                print the thread's checkpoint\n"
              << "  list                         list threads\n"
              << "  delete <thread>              delete a thread\n";
}

/**
 * @brief Draft -> review -> (revise -> review)* -> end.
 */
std::shared_ptr<const CompiledGraph> build_review_graph()
{
    StateSchema schema;
    schema.add_channel("topic", reducers::replace(), "")
        .add_channel("draft", reducers::replace(), "")
        .add_channel("feedback", reducers::append(), Value::array())
        .add_channel("revisions", reducers::replace(), 0)
        .add_channel("approved", reducers::replace(), false);

    GraphBuilder builder{std::move(schema)};
    builder.add_node("draft", [](NodeContext& ctx) -> NodeResult
    {
        ctx.emit_status("drafting report");
        std::string topic = ctx.state()["topic"].get<std::string>();
        return Update{{"draft", "Report on " + (topic.empty() ? std::string("the codebase") : topic)}};
    });
    builder.add_node("review", [](NodeContext& ctx) -> NodeResult
    {
        Value answer = ctx.interrupt(Value{{"question", "Approve the report?"},
                                           {"draft", ctx.state()["draft"]}});
        if (answer.is_string() && answer.get<std::string>() == "approve")
        {
            return Update{{"approved", true}};
        }
        return Update{{"feedback", answer},
                      {"revisions", ctx.state()["revisions"].get<int>() + 1}};
    });
    builder.add_node("revise", [](NodeContext& ctx) -> NodeResult
    {
        ctx.emit_status("revising report");
        const Value& feedback = ctx.state()["feedback"];
        std::string draft = ctx.state()["draft"].get<std::string>();
        return Update{{"draft", draft + " [revised: " + feedback.back().dump() + "]"}};
    });
    builder.add_edge(kStart, "draft")
        .add_edge("draft", "review")
        .add_conditional_edge("review",
                              [](const RunState& state) -> RouteDecision
                              {
                                  if (state["approved"].get<bool>())
                                  {
                                      return Halt{};
                                  }
                                  return Next{"revise"};
                              },
                              {"revise", kEnd})
        .add_edge("revise", "review");
    return builder.build();
}

void print_event(const RunEvent& event)
{
    Value json = event;
    std::cout << "  event: " << json.dump() << "\n";
}

int print_result(const RunResult& result)
{
    std::cout << "\n" << result.summary() << "\n";
    if (result.interrupted())
    {
        std::cout << "waiting for input: " << result.interrupt->payload.dump(2) << "\n";
    }
    else if (result.completed())
    {
        std::cout << "final state: " << result.state.dump(2) << "\n";
    }
    return result.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        std::cout << "\n\n====== stepflow ======\n" << std::flush;

        std::vector<std::string> args(argv + 1, argv + argc);
        EngineConfig config;
        config.checkpoint.backend = CheckpointBackend::File;
        config.checkpoint.directory = kDefaultDirectory;
        if (args.size() >= 2 && args[0] == "--config")
        {
            config = load_engine_config(args[1]);
            args.erase(args.begin(), args.begin() + 2);
        }
        if (args.empty())
        {
            print_usage();
            return EXIT_FAILURE;
        }

        RunHandle runs{build_review_graph(), config};
        const std::string& command = args[0];
        int status = EXIT_SUCCESS;

        if (command == "start" && args.size() >= 2)
        {
            Value input = Value::object();
            if (args.size() >= 3)
            {
                input["topic"] = args[2];
            }
            status = print_result(runs.invoke(input, args[1], print_event));
        }
        else if (command == "resume" && args.size() >= 3)
        {
            status = print_result(runs.resume(args[1], args[2], print_event));
        }
        else if (command == "show" && args.size() >= 2)
        {
            auto checkpoint = runs.get_state(args[1]);
            if (!checkpoint)
            {
                std::cout << "thread '" << args[1] << "' not found\n";
                status = EXIT_FAILURE;
            }
            else
            {
                Value json = *checkpoint;
                std::cout << json.dump(2) << "\n";
            }
        }
        else if (command == "list")
        {
            for (const auto& thread_id : runs.store()->list_threads())
            {
                std::cout << thread_id << "\n";
            }
        }
        else if (command == "delete" && args.size() >= 2)
        {
            std::cout << (runs.delete_thread(args[1]) ? "deleted\n" : "not found\n");
        }
        else
        {
            print_usage();
            status = EXIT_FAILURE;
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
        return status;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
}
