#include "net/message_channel_stub.h"

#include "core/logger.h"

#include <utility>

namespace replica::net {

bool MessageChannelStub::Open(std::string& out_error) {
    if (!next_open_error_.empty()) {
        out_error = std::move(next_open_error_);
        next_open_error_.clear();
        return false;
    }

    open_ = true;
    ++open_count_;
    events_.push_back(ChannelEvent{.kind = ChannelEventKind::Opened, .payload = {}});
    out_error.clear();
    core::Logger::Info("net", "Message channel stub opened.");
    return true;
}

void MessageChannelStub::Close() {
    if (!open_) {
        return;
    }

    open_ = false;
    ++close_count_;
    events_.push_back(ChannelEvent{.kind = ChannelEventKind::Closed, .payload = {}});
}

bool MessageChannelStub::IsOpen() const {
    return open_;
}

bool MessageChannelStub::Send(std::string_view message, std::string& out_error) {
    if (!open_) {
        out_error = "channel is not open";
        return false;
    }
    if (!next_send_error_.empty()) {
        out_error = std::move(next_send_error_);
        next_send_error_.clear();
        return false;
    }

    sent_messages_.emplace_back(message);
    out_error.clear();
    return true;
}

bool MessageChannelStub::PollEvent(ChannelEvent& out_event) {
    if (events_.empty()) {
        return false;
    }

    out_event = std::move(events_.front());
    events_.pop_front();
    if (out_event.kind == ChannelEventKind::Closed) {
        open_ = false;
    }
    return true;
}

void MessageChannelStub::QueueEvent(ChannelEvent event) {
    events_.push_back(std::move(event));
}

void MessageChannelStub::QueueMessage(std::string payload) {
    events_.push_back(ChannelEvent{.kind = ChannelEventKind::Message, .payload = std::move(payload)});
}

void MessageChannelStub::FailNextOpen(std::string error_text) {
    next_open_error_ = std::move(error_text);
}

void MessageChannelStub::FailNextSend(std::string error_text) {
    next_send_error_ = std::move(error_text);
}

const std::vector<std::string>& MessageChannelStub::SentMessages() const {
    return sent_messages_;
}

std::size_t MessageChannelStub::PendingEventCount() const {
    return events_.size();
}

std::uint64_t MessageChannelStub::OpenCount() const {
    return open_count_;
}

std::uint64_t MessageChannelStub::CloseCount() const {
    return close_count_;
}

}  // namespace replica::net
