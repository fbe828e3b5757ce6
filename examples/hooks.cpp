// Multi-turn session with hooks, against an agent connected on stdin/stdout.
// Protocol traffic uses stdout, so everything human-readable goes to stderr.

#include <agentctl/agentctl.hpp>
#include <iostream>

int main()
{
    agentctl::EngineOptions opts;

    // Callback receives hook input (JSON), tool_use_id (string) and the request context.
    // `continue_` and `async_` go out as `continue` and `async`.
    auto pre_tool_callback = [](const agentctl::json& input, const std::string& tool_use_id,
                                const agentctl::HookContext& context) -> agentctl::json
    {
        std::string hook_event = input.value("hook_event_name", "");
        std::string tool_name = input.value("tool_name", "");

        std::cerr << "[HOOK " << context.callback_id << "] " << hook_event
                  << " - Tool: " << tool_name;
        if (!tool_use_id.empty())
            std::cerr << " (ID: " << tool_use_id << ")";
        std::cerr << "\n";

        const agentctl::json tool_input = input.value("tool_input", agentctl::json::object());
        if (tool_name == "Bash" && tool_input.is_object())
        {
            std::string command = tool_input.value("command", "");
            if (command.find("rm -rf") != std::string::npos)
                return agentctl::json{{"continue_", false},
                                      {"stopReason", "Destructive command blocked"}};
        }

        return agentctl::json{{"continue_", true}};
    };

    auto stop_callback = [](const agentctl::json&, const std::string&,
                            const agentctl::HookContext&) -> agentctl::json
    {
        std::cerr << "[HOOK] Stop\n";
        return nullptr; // no directives
    };

    opts.hooks[agentctl::HookEvent::PreToolUse] = {agentctl::HookMatcher{
        "Bash|Write|Edit",   // Matcher pattern for Bash, Write, and Edit tools
        {pre_tool_callback}, // List of callbacks
        30.0                 // Seconds
    }};
    opts.hooks[agentctl::HookEvent::Stop] = {agentctl::HookMatcher{std::nullopt, {stop_callback}}};

    try
    {
        agentctl::ControlEngine engine(opts, agentctl::create_stream_transport(std::cin, std::cout));
        engine.start();

        agentctl::json info = engine.initialize();
        std::cerr << "Connected (" << info.value("commands", agentctl::json::array()).size()
                  << " commands available)\n\n";

        std::vector<std::string> queries = {"What's the current date? Use bash to find out.",
                                            "Create a file called test.txt with 'Hello World'",
                                            "Read the file and tell me what it says"};

        for (const auto& query : queries)
        {
            std::cerr << ">>> " << query << "\n\n";

            engine.send_user_message(query);

            for (const auto& msg : engine.receive_response())
            {
                if (agentctl::is_assistant_message(msg))
                {
                    const auto& assistant = std::get<agentctl::AssistantMessage>(msg);
                    std::cerr << agentctl::get_text_content(assistant.content) << std::flush;
                }
                else if (agentctl::is_result_message(msg))
                {
                    const auto& result = std::get<agentctl::ResultMessage>(msg);
                    std::cerr << "\n[" << result.num_turns << " turns, " << result.duration_ms
                              << " ms]\n\n";
                }
            }
        }

        engine.stop();
        std::cerr << "Done!\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
