#include "net/message_channel.h"

namespace replica::net {

const char* ChannelEventKindName(ChannelEventKind kind) {
    switch (kind) {
        case ChannelEventKind::Opened:
            return "opened";
        case ChannelEventKind::Message:
            return "message";
        case ChannelEventKind::Error:
            return "error";
        case ChannelEventKind::Closed:
            return "closed";
    }

    return "unknown";
}

}  // namespace replica::net
