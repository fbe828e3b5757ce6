#ifndef AGENTCTL_INTERNAL_MESSAGE_PARSER_HPP
#define AGENTCTL_INTERNAL_MESSAGE_PARSER_HPP

#include <agentctl/types.hpp>
#include <string>

namespace agentctl
{
namespace protocol
{

// Turns one decoded content envelope into a typed Message. Stateless; every entry point
// throws MessageParseError on a schema violation.
class MessageParser
{
  public:
    static Message parse(const agentctl::json& j);

    // Decode JSON text, then parse(). Throws JSONDecodeError on malformed text.
    static Message parse_message(const std::string& json_str);

  private:
    static ContentBlock parse_content_block(const agentctl::json& j,
                                            const std::string& message_type,
                                            const agentctl::json& envelope);
    static std::vector<ContentBlock> parse_content_blocks(const agentctl::json& blocks,
                                                          const std::string& message_type,
                                                          const agentctl::json& envelope);

    static UserMessage parse_user_message(const agentctl::json& j);
    static AssistantMessage parse_assistant_message(const agentctl::json& j);
    static SystemMessage parse_system_message(const agentctl::json& j);
    static ResultMessage parse_result_message(const agentctl::json& j);
};

} // namespace protocol
} // namespace agentctl

#endif // AGENTCTL_INTERNAL_MESSAGE_PARSER_HPP
