#pragma once

#include "net/message_channel.h"
#include "session/session_driver.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace replica::net {

// Routes channel events into a session driver and writes the driver's
// requests back to the channel. Never sends while a reply is outstanding.
class SessionLink final {
public:
    SessionLink(IMessageChannel& channel, session::SessionDriver& driver);

    SessionLink(const SessionLink&) = delete;
    SessionLink& operator=(const SessionLink&) = delete;

    bool Open(std::string& out_error);
    // Drains every event currently available. Returns the number handled.
    std::size_t Pump();
    bool IsClosed() const;

    bool HasReplyOutstanding() const;
    std::uint64_t SentRequestCount() const;
    std::uint64_t ReceivedReplyCount() const;
    std::uint64_t UnexpectedMessageCount() const;
    std::uint64_t ChannelErrorCount() const;
    std::uint64_t MaxOutstandingRequests() const;
    const std::string& LastChannelError() const;

private:
    void HandleEvent(const ChannelEvent& event);
    void Apply(const session::SessionStep& step);

    IMessageChannel& channel_;
    session::SessionDriver& driver_;

    bool closed_ = false;
    std::uint64_t outstanding_requests_ = 0;
    std::uint64_t max_outstanding_requests_ = 0;
    std::uint64_t sent_request_count_ = 0;
    std::uint64_t received_reply_count_ = 0;
    std::uint64_t unexpected_message_count_ = 0;
    std::uint64_t channel_error_count_ = 0;
    std::string last_channel_error_;
};

}  // namespace replica::net
