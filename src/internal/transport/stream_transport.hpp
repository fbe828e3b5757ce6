#ifndef AGENTCTL_INTERNAL_TRANSPORT_STREAM_TRANSPORT_HPP
#define AGENTCTL_INTERNAL_TRANSPORT_STREAM_TRANSPORT_HPP

#include "../json_line_decoder.hpp"

#include <agentctl/transport.hpp>
#include <atomic>
#include <istream>
#include <mutex>
#include <ostream>

namespace agentctl
{
namespace transport
{

// Transport over a caller-owned istream/ostream pair, one JSON value per line.
class StreamTransport : public Transport
{
  public:
    StreamTransport(std::istream& in, std::ostream& out, size_t max_buffer_size);
    ~StreamTransport() override;

    void connect() override;
    void write(const std::string& data) override;
    std::vector<json> read_messages() override;
    bool has_messages() const override;
    void close() override;
    bool is_ready() const override;
    void end_input() override;
    bool is_running() const override;

  private:
    std::istream& in_;
    std::ostream& out_;
    protocol::JsonLineDecoder decoder_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> input_ended_{false};
    std::atomic<bool> eof_{false};
    std::mutex write_mutex_;
};

} // namespace transport
} // namespace agentctl

#endif // AGENTCTL_INTERNAL_TRANSPORT_STREAM_TRANSPORT_HPP
