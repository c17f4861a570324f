#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace powpool::protocol {

class ChannelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Bidirectional line-oriented text channel. One reader thread at a time;
 * write_line may be called from several threads concurrently.
 */
class LineChannel {
public:
    virtual ~LineChannel() = default;

    // Blocks until a full line arrives; terminator stripped. Empty on end of stream.
    // Throws ChannelError on I/O failure.
    virtual std::optional<std::string> read_line() = 0;

    // Writes line + '\n'. Throws ChannelError on I/O failure or after close().
    virtual void write_line(std::string_view line) = 0;

    // Shuts the connection down and wakes a blocked reader. Idempotent.
    virtual void close() = 0;

    // Remote endpoint, "address:port".
    virtual std::string peer() const = 0;
};

} // namespace powpool::protocol
