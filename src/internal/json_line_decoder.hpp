#ifndef AGENTCTL_INTERNAL_JSON_LINE_DECODER_HPP
#define AGENTCTL_INTERNAL_JSON_LINE_DECODER_HPP

#include <agentctl/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentctl
{
namespace protocol
{

// Splits a byte stream into newline-delimited JSON values. Lines that do not decode on
// their own are joined with the following lines until the accumulated text decodes.
// While nothing is accumulated, a line that does not decode is trimmed to start at its
// first '{', or skipped when it has none.
class JsonLineDecoder
{
  public:
    explicit JsonLineDecoder(size_t max_buffer_size = 1024 * 1024);

    // Feed raw bytes; returns every value completed by them, in order.
    // Throws JSONDecodeError (and clears the buffer) when more than max_buffer_size bytes
    // are held without completing a value.
    std::vector<json> add_data(const std::string& data);

    bool has_buffered_data() const
    {
        return !buffer_.empty() || !pending_.empty();
    }

    void clear_buffer()
    {
        buffer_.clear();
        pending_.clear();
    }

  private:
    std::string buffer_;  // bytes after the last newline
    std::string pending_; // complete lines that do not form a value yet
    size_t max_buffer_size_;

    std::optional<std::string> extract_line();
};

} // namespace protocol
} // namespace agentctl

#endif // AGENTCTL_INTERNAL_JSON_LINE_DECODER_HPP
