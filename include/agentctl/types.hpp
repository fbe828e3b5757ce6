#ifndef AGENTCTL_TYPES_HPP
#define AGENTCTL_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentctl
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// In-process MCP server handler: takes a JSON-RPC message, returns the JSON-RPC response.
using McpRequestHandler = std::function<json(const json&)>;

// ============================================================================
// Agent definitions (sent with the initialize request)
// ============================================================================

struct AgentDefinition
{
    std::string description;                                      // Required
    std::string prompt;                                           // Required
    std::optional<std::vector<std::string>> tools = std::nullopt; // Optional tools list
    std::optional<std::string> model = std::nullopt;              // e.g. "inherit"

    json to_json() const;
};

// ============================================================================
// Permission Update Types
// ============================================================================

namespace PermissionUpdateDestination
{
constexpr const char* UserSettings = "userSettings";
constexpr const char* ProjectSettings = "projectSettings";
constexpr const char* LocalSettings = "localSettings";
constexpr const char* Session = "session";
} // namespace PermissionUpdateDestination

namespace PermissionBehavior
{
constexpr const char* Allow = "allow";
constexpr const char* Deny = "deny";
constexpr const char* Ask = "ask";
} // namespace PermissionBehavior

struct PermissionRuleValue
{
    std::string tool_name;
    std::optional<std::string> rule_content = std::nullopt;
};

/// One entry of permission_suggestions (inbound) or updatedPermissions (outbound).
struct PermissionUpdate
{
    std::string type; // "addRules", "replaceRules", "removeRules", "setMode", "addDirectories",
                      // "removeDirectories"
    std::optional<std::vector<PermissionRuleValue>> rules = std::nullopt;
    std::optional<std::string> behavior = std::nullopt;
    std::optional<std::string> mode = std::nullopt;
    std::optional<std::vector<std::string>> directories = std::nullopt;
    std::optional<std::string> destination = std::nullopt;

    /// Wire form; only the fields relevant to `type` are emitted
    json to_json() const;

    /// Lenient decode: unknown or mistyped fields are skipped
    static PermissionUpdate from_json(const json& j);
};

// ============================================================================
// Tool permission callback types
// ============================================================================

/// Ancillary data handed to the permission callback. Open record: the raw request
/// payload is kept so callers can read fields this struct does not model.
struct ToolPermissionContext
{
    std::string request_id;
    std::vector<PermissionUpdate> suggestions;
    json raw_request = json::object();
};

struct PermissionResultAllow
{
    std::optional<json> updated_input = std::nullopt;
    std::optional<std::vector<PermissionUpdate>> updated_permissions = std::nullopt;
};

struct PermissionResultDeny
{
    std::string message;
    bool interrupt = false;
};

using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

/// Decision used for can_use_tool when no permission callback is registered.
enum class DefaultPermissionBehavior
{
    Allow,
    Deny
};

// ============================================================================
// Hook types
// ============================================================================

namespace HookEvent
{
constexpr const char* PreToolUse = "PreToolUse";
constexpr const char* PostToolUse = "PostToolUse";
constexpr const char* PostToolUseFailure = "PostToolUseFailure";
constexpr const char* UserPromptSubmit = "UserPromptSubmit";
constexpr const char* Stop = "Stop";
constexpr const char* SubagentStart = "SubagentStart";
constexpr const char* SubagentStop = "SubagentStop";
constexpr const char* PreCompact = "PreCompact";
constexpr const char* Notification = "Notification";
constexpr const char* PermissionRequest = "PermissionRequest";
} // namespace HookEvent

/// Ancillary data handed to hook callbacks. Open record, like ToolPermissionContext.
struct HookContext
{
    std::string request_id;
    std::string callback_id;
    json raw_request = json::object();
};

/// Callback invoked when a registered hook fires.
/// @param input Hook input as sent by the peer (hook_event_name, tool_name, tool_input, ...)
/// @param tool_use_id Tool use identifier, empty when the event has none
/// @return Hook output mapping. `async_` and `continue_` are accepted as aliases of
///         `async` and `continue`. A null result means "no directives".
using HookCallback = std::function<json(const json& input, const std::string& tool_use_id,
                                        const HookContext& context)>;

/// Callback invoked when the peer asks whether a tool may run.
using ToolPermissionCallback = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context)>;

/// Receives diagnostics (protocol anomalies, ignored envelopes, transport failures).
using DiagnosticCallback = std::function<void(const std::string& line)>;

struct HookMatcher
{
    /// Tool pattern, e.g. "Bash" or "Write|Edit"; nullopt matches everything
    std::optional<std::string> matcher;
    std::vector<HookCallback> hooks;
    /// Seconds, fractional allowed
    std::optional<double> timeout;

    HookMatcher() = default;
    HookMatcher(std::optional<std::string> m, std::vector<HookCallback> h,
                std::optional<double> t = std::nullopt)
        : matcher(std::move(m)), hooks(std::move(h)), timeout(t)
    {
    }
};

// ============================================================================
// Content blocks
// ============================================================================

struct TextBlock
{
    std::string text;
};

struct ThinkingBlock
{
    std::string thinking;
    std::string signature; // Provider signature, opaque
};

struct ToolUseBlock
{
    std::string id;
    std::string name;
    json input;
};

struct ToolResultBlock
{
    std::string tool_use_id;
    json content; // string, array of blocks, or null
    bool is_error = false;
};

using ContentBlock = std::variant<TextBlock, ThinkingBlock, ToolUseBlock, ToolResultBlock>;

// ============================================================================
// Messages
// ============================================================================

enum class AssistantMessageError
{
    AuthenticationFailed,
    BillingError,
    RateLimit,
    InvalidRequest,
    ServerError,
    Unknown
};

AssistantMessageError assistant_error_from_string(const std::string& value);
const char* to_string(AssistantMessageError error);

using UserContent = std::variant<std::string, std::vector<ContentBlock>>;

struct UserMessage
{
    UserContent content;
    std::optional<std::string> uuid;
    std::optional<std::string> parent_tool_use_id; // Set inside sub-agent invocations
    std::optional<json> tool_use_result;           // Opaque tool execution metadata
    json raw_json;
};

struct AssistantMessage
{
    std::vector<ContentBlock> content;
    std::string model;
    std::optional<AssistantMessageError> error;
    std::optional<std::string> parent_tool_use_id;
    json raw_json;
};

struct SystemMessage
{
    std::string subtype; // "init", ...
    json data;           // Full payload
    json raw_json;
};

struct ResultMessage
{
    std::string subtype;
    std::int64_t duration_ms = 0;
    std::int64_t duration_api_ms = 0;
    bool is_error = false;
    std::int64_t num_turns = 0;
    std::string session_id;
    std::optional<double> total_cost_usd;
    std::optional<json> usage;
    std::optional<std::string> result;
    std::optional<json> structured_output;
    json raw_json;
};

using Message = std::variant<UserMessage, AssistantMessage, SystemMessage, ResultMessage>;

// ============================================================================
// Engine configuration
// ============================================================================

struct EngineOptions
{
    /// Decides can_use_tool requests. When unset, default_permission_behavior applies.
    std::optional<ToolPermissionCallback> tool_permission_callback;
    DefaultPermissionBehavior default_permission_behavior = DefaultPermissionBehavior::Allow;

    /// Hook matchers keyed by event name (see HookEvent). Registered at engine construction
    /// and announced to the peer by initialize().
    std::map<std::string, std::vector<HookMatcher>> hooks;

    /// Agent definitions announced by initialize()
    std::map<std::string, AgentDefinition> agents;

    /// In-process MCP servers: server name -> handler
    std::map<std::string, McpRequestHandler> sdk_mcp_handlers;

    /// Timeout for control requests we issue (interrupt, set_model, ...). <= 0 waits forever.
    int control_request_timeout_ms = 60000;

    /// Timeout for initialize(). AGENTCTL_INITIALIZE_TIMEOUT_MS raises it.
    int initialize_timeout_ms = 60000;

    /// Number of recent peer request ids kept for duplicate detection. A repeated id older
    /// than this window is treated as a new request.
    std::size_t max_remembered_request_ids = 4096;

    /// How long stop() waits for the reader thread after closing the transport before
    /// detaching it. <= 0 waits forever.
    int reader_join_timeout_ms = 1000;

    /// Max bytes buffered for one JSON value by line-framed transports
    std::size_t max_buffer_size = 1024 * 1024;

    /// Receives warnings instead of stderr. Called from the reader and worker threads,
    /// so it must be thread-safe.
    std::optional<DiagnosticCallback> diagnostic_callback;
};

// Helper functions for type checking
inline bool is_user_message(const Message& msg)
{
    return std::holds_alternative<UserMessage>(msg);
}

inline bool is_assistant_message(const Message& msg)
{
    return std::holds_alternative<AssistantMessage>(msg);
}

inline bool is_system_message(const Message& msg)
{
    return std::holds_alternative<SystemMessage>(msg);
}

inline bool is_result_message(const Message& msg)
{
    return std::holds_alternative<ResultMessage>(msg);
}

// Concatenated text of all TextBlocks
std::string get_text_content(const std::vector<ContentBlock>& content);

// Envelope type name of a message ("user", "assistant", ...)
const char* message_type_name(const Message& msg);

} // namespace agentctl

#endif // AGENTCTL_TYPES_HPP
