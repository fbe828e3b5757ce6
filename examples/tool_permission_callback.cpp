// Answers can_use_tool requests from an agent connected on stdin/stdout.
//
//   agent --control-stdio | ./example_tool_permission_callback
//
// Protocol traffic uses stdout, so everything human-readable goes to stderr.

#include <agentctl/agentctl.hpp>
#include <iostream>
#include <set>

int main()
{
    // Allow only specific tools
    std::set<std::string> allowed_tools = {"Read", "Glob", "Grep"};

    agentctl::EngineOptions opts;
    opts.default_permission_behavior = agentctl::DefaultPermissionBehavior::Deny;

    opts.tool_permission_callback =
        [&allowed_tools](const std::string& tool_name, const agentctl::json& input,
                         const agentctl::ToolPermissionContext& context) -> agentctl::PermissionResult
    {
        bool allowed = allowed_tools.count(tool_name) > 0;

        std::cerr << "[TOOL] " << tool_name << (allowed ? " [ALLOWED]" : " [DENIED]") << " ("
                  << context.request_id << ")\n";

        if (!allowed)
            return agentctl::PermissionResultDeny{"Tool '" + tool_name +
                                                  "' is not in the allowed list"};

        // Keep reads inside the working tree
        std::string path = input.value("file_path", "");
        if (tool_name == "Read" && path.rfind("/etc/", 0) == 0)
        {
            agentctl::json redirected = input;
            redirected["file_path"] = "/dev/null";
            return agentctl::PermissionResultAllow{redirected};
        }

        return agentctl::PermissionResultAllow{};
    };

    try
    {
        agentctl::ControlEngine engine(opts, agentctl::create_stream_transport(std::cin, std::cout));
        engine.start();
        engine.initialize();

        std::cerr << "Tool Permissions Example\n";
        std::cerr << "Allowed tools: Read, Glob, Grep\n\n";

        engine.send_user_message("Search for all .cpp files, read one, "
                                 "and then try to write a new file");

        auto stream = engine.receive_messages();
        while (true)
        {
            try
            {
                auto msg = stream.get_next();
                if (!msg)
                    break;

                if (agentctl::is_assistant_message(*msg))
                {
                    const auto& assistant = std::get<agentctl::AssistantMessage>(*msg);
                    std::cerr << agentctl::get_text_content(assistant.content) << std::flush;
                }
                else if (agentctl::is_result_message(*msg))
                {
                    std::cerr << "\n";
                    break;
                }
            }
            catch (const agentctl::MessageParseError& e)
            {
                std::cerr << "Skipping malformed message: " << e.what() << "\n";
            }
        }

        engine.stop();
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
