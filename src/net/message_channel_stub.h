#pragma once

#include "net/message_channel.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>

namespace replica::net {

// In-process channel: records everything sent and delivers queued events.
class MessageChannelStub final : public IMessageChannel {
public:
    bool Open(std::string& out_error) override;
    void Close() override;
    bool IsOpen() const override;
    bool Send(std::string_view message, std::string& out_error) override;
    bool PollEvent(ChannelEvent& out_event) override;

    void QueueEvent(ChannelEvent event);
    void QueueMessage(std::string payload);
    void FailNextOpen(std::string error_text);
    void FailNextSend(std::string error_text);

    const std::vector<std::string>& SentMessages() const;
    std::size_t PendingEventCount() const;
    std::uint64_t OpenCount() const;
    std::uint64_t CloseCount() const;

private:
    bool open_ = false;
    std::deque<ChannelEvent> events_;
    std::vector<std::string> sent_messages_;
    std::string next_open_error_;
    std::string next_send_error_;
    std::uint64_t open_count_ = 0;
    std::uint64_t close_count_ = 0;
};

}  // namespace replica::net
