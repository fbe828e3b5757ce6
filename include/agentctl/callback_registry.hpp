#ifndef AGENTCTL_CALLBACK_REGISTRY_HPP
#define AGENTCTL_CALLBACK_REGISTRY_HPP

#include <agentctl/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agentctl
{

/**
 * Session-scoped table of user callbacks the peer can reach through control requests.
 *
 * Hook callbacks are keyed by opaque ids ("hook_0", "hook_1", ...) that the peer learns from
 * the initialize request. There is at most one permission callback, plus named in-process
 * MCP handlers.
 *
 * The registry is written during engine construction only and read afterwards, so it
 * carries no lock.
 */
class CallbackRegistry
{
  public:
    CallbackRegistry() = default;

    // Register under a fresh id and return it
    std::string register_hook(HookCallback callback);

    // Register under a caller-chosen id, replacing any previous entry
    void register_hook(const std::string& callback_id, HookCallback callback);

    // Throws UnknownCallbackError when absent
    const HookCallback& lookup(const std::string& callback_id) const;

    bool contains(const std::string& callback_id) const;
    std::size_t hook_count() const
    {
        return hooks_.size();
    }

    void set_permission_callback(ToolPermissionCallback callback);
    const std::optional<ToolPermissionCallback>& permission_callback() const
    {
        return permission_callback_;
    }

    void register_mcp_handler(const std::string& server_name, McpRequestHandler handler);
    // nullptr when no handler is registered under that name
    const McpRequestHandler* find_mcp_handler(const std::string& server_name) const;

    /**
     * Register every callback of every matcher and return the "hooks" section of the
     * initialize request:
     *   {"PreToolUse": [{"matcher": "Bash", "hookCallbackIds": ["hook_0"], "timeout": 5}]}
     * Events with no matchers are skipped.
     */
    json register_hook_matchers(const std::map<std::string, std::vector<HookMatcher>>& hooks);

  private:
    std::map<std::string, HookCallback> hooks_;
    int next_callback_id_ = 0;
    std::optional<ToolPermissionCallback> permission_callback_;
    std::map<std::string, McpRequestHandler> mcp_handlers_;
};

} // namespace agentctl

#endif // AGENTCTL_CALLBACK_REGISTRY_HPP
