#include "stream_transport.hpp"

#include <agentctl/errors.hpp>

namespace agentctl
{
namespace transport
{

StreamTransport::StreamTransport(std::istream& in, std::ostream& out, size_t max_buffer_size)
    : in_(in), out_(out), decoder_(max_buffer_size)
{
}

StreamTransport::~StreamTransport()
{
    close();
}

void StreamTransport::connect()
{
    if (connected_)
        return;
    if (!in_.good())
        throw TransportError("Input stream is not readable");
    if (!out_.good())
        throw TransportError("Output stream is not writable");
    connected_ = true;
}

void StreamTransport::write(const std::string& data)
{
    if (!connected_)
        throw TransportError("Transport is not connected");
    if (input_ended_)
        throw TransportError("Cannot write after end_input()");

    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << data;
    out_.flush();
    if (!out_)
        throw TransportError("Failed to write to output stream");
}

std::vector<json> StreamTransport::read_messages()
{
    if (eof_)
        return {};
    if (!connected_)
        throw TransportError("Transport is not connected");

    std::string line;
    if (!std::getline(in_, line))
    {
        eof_ = true;
        if (in_.bad())
            throw TransportError("Failed to read from input stream");
        if (decoder_.has_buffered_data())
        {
            decoder_.clear_buffer();
            throw TransportError("Input stream ended inside a JSON value");
        }
        return {};
    }

    // Closed while the read was blocked
    if (eof_)
        return {};

    try
    {
        return decoder_.add_data(line + "\n");
    }
    catch (const JSONDecodeError& e)
    {
        throw TransportError(e.what());
    }
}

bool StreamTransport::has_messages() const
{
    return connected_ && !eof_;
}

// A blocked std::getline cannot be interrupted from here. Reads that complete after close()
// return nothing and has_messages() turns false.
void StreamTransport::close()
{
    connected_ = false;
    eof_ = true;
}

bool StreamTransport::is_ready() const
{
    return connected_ && !input_ended_;
}

void StreamTransport::end_input()
{
    if (input_ended_.exchange(true))
        return;
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_.flush();
}

bool StreamTransport::is_running() const
{
    return connected_ && !eof_;
}

} // namespace transport

std::unique_ptr<Transport> create_stream_transport(std::istream& in, std::ostream& out,
                                                   std::size_t max_buffer_size)
{
    return std::make_unique<transport::StreamTransport>(in, out, max_buffer_size);
}

} // namespace agentctl
