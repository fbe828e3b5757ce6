#ifndef AGENTCTL_TRANSPORT_HPP
#define AGENTCTL_TRANSPORT_HPP

#include <agentctl/types.hpp>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace agentctl
{

/**
 * Abstract duplex transport between the engine and the agent process.
 *
 * The transport owns framing and process management; the engine only sees serialized
 * outbound lines and decoded inbound JSON values. ControlEngine serializes its own calls
 * to write(), and calls read_messages() from a single reader thread.
 *
 * Failures are reported by throwing TransportError.
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Prepare for communication (start the process, open the connection, ...).
     */
    virtual void connect() = 0;

    /**
     * Write one serialized envelope (JSON + newline).
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Block until at least one inbound JSON value is available, or the stream ends.
     * May return an empty vector while data is still arriving; once has_messages() is false,
     * an empty vector means end of stream. Values are returned in arrival order and are not
     * guaranteed to be objects.
     */
    virtual std::vector<json> read_messages() = 0;

    /**
     * False once the inbound stream has definitely ended.
     */
    virtual bool has_messages() const = 0;

    /**
     * Close the transport and release its resources. Should unblock a pending
     * read_messages() where the underlying stream allows it. ControlEngine::stop() detaches
     * a reader that stays blocked.
     */
    virtual void close() = 0;

    virtual bool is_ready() const = 0;

    /**
     * Signal that no more input will be sent (close stdin for process transports).
     */
    virtual void end_input() = 0;

    virtual bool is_running() const = 0;
};

// Line-framed transport over an existing stream pair (pipes, sockets wrapped in iostreams,
// std::cin/std::cout). The streams must outlive the transport. close() cannot interrupt a
// read blocked on a live peer, so when ControlEngine::stop() detaches the reader, the input
// stream must stay valid until that read returns (std::cin does).
std::unique_ptr<Transport> create_stream_transport(std::istream& in, std::ostream& out,
                                                   std::size_t max_buffer_size = 1024 * 1024);

} // namespace agentctl

#endif // AGENTCTL_TRANSPORT_HPP
