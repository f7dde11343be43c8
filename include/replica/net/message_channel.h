#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace replica::net {

enum class ChannelEventKind : std::uint8_t {
    Opened = 1,
    Message = 2,
    Error = 3,
    Closed = 4,
};

const char* ChannelEventKindName(ChannelEventKind kind);

struct ChannelEvent final {
    ChannelEventKind kind = ChannelEventKind::Closed;
    // Message payload, or error text for Error events.
    std::string payload;
};

// Ordered duplex text channel. Events are delivered by polling; each
// message sent is one opaque request, each Message event one reply.
class IMessageChannel {
public:
    virtual ~IMessageChannel() = default;

    virtual bool Open(std::string& out_error) = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
    virtual bool Send(std::string_view message, std::string& out_error) = 0;
    virtual bool PollEvent(ChannelEvent& out_event) = 0;
};

}  // namespace replica::net
