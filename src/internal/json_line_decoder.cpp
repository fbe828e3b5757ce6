#include "json_line_decoder.hpp"

#include <agentctl/errors.hpp>

namespace agentctl
{
namespace protocol
{

JsonLineDecoder::JsonLineDecoder(size_t max_buffer_size) : max_buffer_size_(max_buffer_size) {}

std::vector<json> JsonLineDecoder::add_data(const std::string& data)
{
    buffer_ += data;

    if (buffer_.size() + pending_.size() > max_buffer_size_)
    {
        size_t size = buffer_.size() + pending_.size();
        clear_buffer();
        throw JSONDecodeError("Buffer exceeded maximum size of " +
                              std::to_string(max_buffer_size_) + " bytes (was " +
                              std::to_string(size) + ")");
    }

    std::vector<json> values;

    while (auto line = extract_line())
    {
        if (line->find_first_not_of(" \t\r") == std::string::npos)
            continue;

        // Wrapper scripts may print plain text before the JSON payloads
        if (pending_.empty() && !json::accept(*line))
        {
            size_t brace = line->find('{');
            if (brace == std::string::npos)
                continue;
            line->erase(0, brace);
        }

        pending_ += *line;

        json value = json::parse(pending_, nullptr, false);
        if (value.is_discarded())
            continue; // incomplete, wait for more lines

        pending_.clear();
        values.push_back(std::move(value));
    }

    return values;
}

std::optional<std::string> JsonLineDecoder::extract_line()
{
    size_t pos = buffer_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt;

    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);

    if (!line.empty() && line.back() == '\r')
        line.pop_back();

    return line;
}

} // namespace protocol
} // namespace agentctl
