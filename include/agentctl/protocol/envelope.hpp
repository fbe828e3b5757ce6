#ifndef AGENTCTL_PROTOCOL_ENVELOPE_HPP
#define AGENTCTL_PROTOCOL_ENVELOPE_HPP

#include <agentctl/protocol/control.hpp>
#include <agentctl/types.hpp>
#include <string>
#include <utility>

namespace agentctl
{
namespace protocol
{

// Hook output keys that carry a suffix in user code and must go out unsuffixed.
// Only the top level of a hook output is rewritten.
constexpr std::pair<const char*, const char*> kReservedKeyRewrites[] = {
    {"async_", "async"},
    {"continue_", "continue"},
};

// {"type":"control_response","response":{"subtype":"success","request_id":..,"response":..}}
json make_success_response(const std::string& request_id, const json& payload);

// {"type":"control_response","response":{"subtype":"error","request_id":..,"error":..}}
json make_error_response(const std::string& request_id, const std::string& error);

// {"type":"control_request","request_id":..,"request":{"subtype":..,...request_data}}
json make_control_request(const std::string& request_id, const std::string& subtype,
                          const json& request_data);

// {behavior: allow[, updatedInput][, updatedPermissions]} or
// {behavior: deny, message[, interrupt: true]}
json permission_result_to_json(const PermissionResult& result);

// Applies kReservedKeyRewrites. Non-object values are returned unchanged. When both the
// suffixed and the wire key are present, the wire key wins.
json translate_hook_output(const json& hook_output);

// Decode inbound control envelopes; throw ProtocolError when a required part is missing.
ControlRequest parse_control_request(const json& envelope);
ControlResponse parse_control_response(const json& envelope);

// Serialized wire line: compact JSON plus '\n'
std::string to_line(const json& envelope);

} // namespace protocol
} // namespace agentctl

#endif // AGENTCTL_PROTOCOL_ENVELOPE_HPP
