#include <agentctl/callback_registry.hpp>
#include <agentctl/errors.hpp>

namespace agentctl
{

std::string CallbackRegistry::register_hook(HookCallback callback)
{
    std::string callback_id;
    do
    {
        callback_id = "hook_" + std::to_string(next_callback_id_++);
    } while (hooks_.count(callback_id) != 0);

    hooks_[callback_id] = std::move(callback);
    return callback_id;
}

void CallbackRegistry::register_hook(const std::string& callback_id, HookCallback callback)
{
    hooks_[callback_id] = std::move(callback);
}

const HookCallback& CallbackRegistry::lookup(const std::string& callback_id) const
{
    auto it = hooks_.find(callback_id);
    if (it == hooks_.end())
        throw UnknownCallbackError(callback_id);
    return it->second;
}

bool CallbackRegistry::contains(const std::string& callback_id) const
{
    return hooks_.count(callback_id) != 0;
}

void CallbackRegistry::set_permission_callback(ToolPermissionCallback callback)
{
    permission_callback_ = std::move(callback);
}

void CallbackRegistry::register_mcp_handler(const std::string& server_name,
                                            McpRequestHandler handler)
{
    mcp_handlers_[server_name] = std::move(handler);
}

const McpRequestHandler* CallbackRegistry::find_mcp_handler(const std::string& server_name) const
{
    auto it = mcp_handlers_.find(server_name);
    if (it == mcp_handlers_.end())
        return nullptr;
    return &it->second;
}

json CallbackRegistry::register_hook_matchers(
    const std::map<std::string, std::vector<HookMatcher>>& hooks)
{
    json hooks_config = json::object();

    for (const auto& [event, matchers] : hooks)
    {
        if (matchers.empty())
            continue;

        json matchers_array = json::array();
        for (const auto& matcher : matchers)
        {
            json callback_ids = json::array();
            for (const auto& callback : matcher.hooks)
                callback_ids.push_back(register_hook(callback));

            json entry = {{"hookCallbackIds", callback_ids}};
            if (matcher.matcher.has_value())
                entry["matcher"] = *matcher.matcher;
            else
                entry["matcher"] = nullptr;
            if (matcher.timeout.has_value())
                entry["timeout"] = *matcher.timeout;

            matchers_array.push_back(entry);
        }

        hooks_config[event] = matchers_array;
    }

    return hooks_config;
}

} // namespace agentctl
