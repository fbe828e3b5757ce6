/**
 * replay.cpp - protocol transcript replay
 *
 * Feeds a recorded JSONL transcript (one inbound envelope per line, as the agent wrote it)
 * through a ControlEngine. Typed messages, callback invocations and diagnostics are logged
 * to stderr; the control responses the engine would send back are written to stdout as JSONL.
 *
 * Usage: agentctl_replay [--deny] [--no-color] <transcript.jsonl>
 *
 *   --deny      answer can_use_tool with deny instead of allow
 *   --no-color  plain stderr output
 *
 * One logging hook is registered for every hook event, so hook_callback requests naming
 * hook_0 .. hook_N are answered. The id assignment is printed at startup.
 */

#include <agentctl/agentctl.hpp>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

using namespace agentctl;

namespace
{

// ============================================================================
// ANSI Color Codes for Terminal Output
// ============================================================================

namespace Color
{
const char* RESET = "\033[0m";
const char* RED = "\033[31m";
const char* GREEN = "\033[32m";
const char* YELLOW = "\033[33m";
const char* BLUE = "\033[34m";
const char* MAGENTA = "\033[35m";
const char* CYAN = "\033[36m";
} // namespace Color

// ============================================================================
// ReplayLogger - thread-safe stderr logging with timestamps and counters
// ============================================================================

class ReplayLogger
{
  public:
    explicit ReplayLogger(bool color) : start_time_(std::chrono::steady_clock::now()), color_(color)
    {
    }

    void log(const char* color, const std::string& category, const std::string& message)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (color_)
            std::cerr << color;
        std::cerr << "[" << timestamp() << "] " << category << ": " << message;
        if (color_)
            std::cerr << Color::RESET;
        std::cerr << "\n";
    }

    void count(const std::string& key)
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_[key];
    }

    void print_stats()
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        std::cerr << "\n=== Replay statistics ===\n";
        for (const auto& [key, value] : stats_)
            std::cerr << "  " << std::left << std::setw(24) << key << value << "\n";
    }

  private:
    std::string timestamp() const
    {
        auto elapsed = std::chrono::steady_clock::now() - start_time_;
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

        std::ostringstream oss;
        oss << std::setfill('0') << std::setw(2) << (ms / 1000) << "." << std::setw(3)
            << (ms % 1000);
        return oss.str();
    }

    std::mutex mutex_;
    std::mutex stats_mutex_;
    std::map<std::string, int> stats_;
    std::chrono::steady_clock::time_point start_time_;
    bool color_;
};

std::string summarize(const Message& msg)
{
    std::ostringstream oss;

    if (const auto* user = std::get_if<UserMessage>(&msg))
    {
        if (const auto* text = std::get_if<std::string>(&user->content))
            oss << "\"" << *text << "\"";
        else
            oss << std::get<std::vector<ContentBlock>>(user->content).size() << " block(s)";
        if (user->parent_tool_use_id)
            oss << " [parent " << *user->parent_tool_use_id << "]";
    }
    else if (const auto* assistant = std::get_if<AssistantMessage>(&msg))
    {
        oss << assistant->model << ": ";
        for (const auto& block : assistant->content)
        {
            if (const auto* text = std::get_if<TextBlock>(&block))
                oss << "\"" << text->text << "\" ";
            else if (const auto* tool_use = std::get_if<ToolUseBlock>(&block))
                oss << "tool_use(" << tool_use->name << ") ";
            else if (std::holds_alternative<ThinkingBlock>(block))
                oss << "thinking ";
            else
                oss << "tool_result ";
        }
        if (assistant->error)
            oss << "[error " << to_string(*assistant->error) << "]";
    }
    else if (const auto* system = std::get_if<SystemMessage>(&msg))
    {
        oss << system->subtype;
    }
    else
    {
        const auto& result = std::get<ResultMessage>(msg);
        oss << result.subtype << " turns=" << result.num_turns << " duration=" << result.duration_ms
            << "ms session=" << result.session_id;
        if (result.total_cost_usd)
            oss << " cost=$" << std::fixed << std::setprecision(4) << *result.total_cost_usd;
    }

    return oss.str();
}

void print_usage()
{
    std::cerr << "Usage: agentctl_replay [--deny] [--no-color] <transcript.jsonl>\n";
}

} // namespace

int main(int argc, char* argv[])
{
    bool deny = false;
    bool color = true;
    std::string path;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--deny")
            deny = true;
        else if (arg == "--no-color")
            color = false;
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (path.empty())
            path = arg;
        else
        {
            print_usage();
            return 2;
        }
    }

    if (path.empty())
    {
        print_usage();
        return 2;
    }

    std::ifstream transcript(path);
    if (!transcript.is_open())
    {
        std::cerr << "Error: cannot open " << path << "\n";
        return 1;
    }

    ReplayLogger logger(color);

    EngineOptions opts;
    opts.diagnostic_callback = [&logger](const std::string& line)
    {
        logger.count("diagnostics");
        logger.log(Color::YELLOW, "WARN", line);
    };

    opts.tool_permission_callback = [&logger, deny](const std::string& tool_name,
                                                    const json& input,
                                                    const ToolPermissionContext& context)
        -> PermissionResult
    {
        logger.count("can_use_tool");
        logger.log(Color::MAGENTA, "PERMISSION",
                   tool_name + " " + input.dump() + " (" + context.request_id + ", " +
                       std::to_string(context.suggestions.size()) + " suggestion(s)) -> " +
                       (deny ? "deny" : "allow"));
        if (deny)
            return PermissionResultDeny{"Denied by agentctl_replay"};
        return PermissionResultAllow{};
    };

    const char* events[] = {HookEvent::PreToolUse,       HookEvent::PostToolUse,
                            HookEvent::PostToolUseFailure, HookEvent::UserPromptSubmit,
                            HookEvent::Stop,             HookEvent::SubagentStart,
                            HookEvent::SubagentStop,     HookEvent::PreCompact,
                            HookEvent::Notification,     HookEvent::PermissionRequest};
    for (const char* event : events)
    {
        std::string name = event;
        HookCallback hook = [&logger, name](const json& input, const std::string& tool_use_id,
                                            const HookContext& context) -> json
        {
            logger.count("hook_callback");
            logger.log(Color::CYAN, "HOOK",
                       name + " via " + context.callback_id +
                           (tool_use_id.empty() ? "" : " tool_use_id=" + tool_use_id) + " " +
                           input.dump());
            return json::object();
        };
        opts.hooks[name] = {HookMatcher{std::nullopt, {hook}}};
    }

    try
    {
        ControlEngine engine(opts, create_stream_transport(transcript, std::cout));

        // std::map orders events by name, which fixes the id each one receives
        int index = 0;
        for (const auto& [event, matchers] : opts.hooks)
            logger.log(Color::BLUE, "SETUP", "hook_" + std::to_string(index++) + " = " + event);

        engine.start();

        auto stream = engine.receive_messages();
        while (true)
        {
            try
            {
                auto msg = stream.get_next();
                if (!msg)
                    break;

                const char* type = message_type_name(*msg);
                logger.count(type);
                logger.log(is_result_message(*msg) ? Color::GREEN : Color::RESET, type,
                           summarize(*msg));
            }
            catch (const MessageParseError& e)
            {
                logger.count("parse_errors");
                logger.log(Color::RED, "PARSE", e.what());
            }
        }

        engine.stop();
    }
    catch (const TransportError& e)
    {
        logger.log(Color::RED, "TRANSPORT", e.what());
        logger.print_stats();
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    logger.print_stats();
    return 0;
}
