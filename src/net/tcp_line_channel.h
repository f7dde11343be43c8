#pragma once

#include "net/message_channel.h"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace replica::net {

struct TcpEndpoint final {
    std::string host = "127.0.0.1";
    std::uint16_t port = 0;
};

// Non-blocking IPv4 TCP client carrying one message per '\n' terminated line.
class TcpLineChannel final : public IMessageChannel {
public:
    explicit TcpLineChannel(TcpEndpoint endpoint);
    ~TcpLineChannel() override;

    TcpLineChannel(const TcpLineChannel&) = delete;
    TcpLineChannel& operator=(const TcpLineChannel&) = delete;

    bool Open(std::string& out_error) override;
    void Close() override;
    bool IsOpen() const override;
    bool Send(std::string_view message, std::string& out_error) override;
    bool PollEvent(ChannelEvent& out_event) override;

    const TcpEndpoint& Endpoint() const;
    bool IsConnected() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace replica::net
