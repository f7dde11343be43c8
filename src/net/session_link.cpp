#include "net/session_link.h"

#include "core/logger.h"

#include <algorithm>
#include <string>

namespace replica::net {

SessionLink::SessionLink(IMessageChannel& channel, session::SessionDriver& driver)
    : channel_(channel),
      driver_(driver) {}

bool SessionLink::Open(std::string& out_error) {
    closed_ = false;
    if (!channel_.Open(out_error)) {
        closed_ = true;
        core::Logger::Error("net", "Channel open failed: " + out_error);
        return false;
    }

    return true;
}

std::size_t SessionLink::Pump() {
    std::size_t handled_count = 0;
    ChannelEvent event;
    while (channel_.PollEvent(event)) {
        HandleEvent(event);
        ++handled_count;
    }

    return handled_count;
}

void SessionLink::HandleEvent(const ChannelEvent& event) {
    switch (event.kind) {
        case ChannelEventKind::Opened:
            core::Logger::Info("net", "Channel opened.");
            Apply(driver_.Start());
            return;
        case ChannelEventKind::Message:
            if (outstanding_requests_ == 0 || !driver_.HasRequestInFlight()) {
                ++unexpected_message_count_;
                core::Logger::Warn("net", "Dropping message received with no request in flight.");
                return;
            }

            --outstanding_requests_;
            ++received_reply_count_;
            Apply(driver_.Resume(event.payload));
            return;
        case ChannelEventKind::Error:
            ++channel_error_count_;
            last_channel_error_ = event.payload;
            core::Logger::Warn("net", "Channel error: " + event.payload);
            return;
        case ChannelEventKind::Closed:
            if (closed_) {
                return;
            }

            closed_ = true;
            outstanding_requests_ = 0;
            core::Logger::Info("net", "Channel closed.");
            driver_.NotifyTransportClosed();
            return;
    }
}

void SessionLink::Apply(const session::SessionStep& step) {
    if (!step.IsSend()) {
        core::Logger::Info("net", "Session finished, closing channel: " + step.reason);
        channel_.Close();
        return;
    }

    if (outstanding_requests_ != 0) {
        core::Logger::Error("net", "Refusing to send while a reply is outstanding.");
        channel_.Close();
        return;
    }

    std::string send_error;
    if (!channel_.Send(step.request, send_error)) {
        ++channel_error_count_;
        last_channel_error_ = send_error;
        core::Logger::Error("net", "Send failed: " + send_error);
        channel_.Close();
        return;
    }

    ++outstanding_requests_;
    ++sent_request_count_;
    max_outstanding_requests_ = std::max(max_outstanding_requests_, outstanding_requests_);
}

bool SessionLink::IsClosed() const {
    return closed_;
}

bool SessionLink::HasReplyOutstanding() const {
    return outstanding_requests_ != 0;
}

std::uint64_t SessionLink::SentRequestCount() const {
    return sent_request_count_;
}

std::uint64_t SessionLink::ReceivedReplyCount() const {
    return received_reply_count_;
}

std::uint64_t SessionLink::UnexpectedMessageCount() const {
    return unexpected_message_count_;
}

std::uint64_t SessionLink::ChannelErrorCount() const {
    return channel_error_count_;
}

std::uint64_t SessionLink::MaxOutstandingRequests() const {
    return max_outstanding_requests_;
}

const std::string& SessionLink::LastChannelError() const {
    return last_channel_error_;
}

}  // namespace replica::net
