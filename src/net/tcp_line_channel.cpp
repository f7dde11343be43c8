#include "net/tcp_line_channel.h"

#include "net/line_framer.h"

#include <array>
#include <cstring>
#include <deque>
#include <string>
#include <utility>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#endif

namespace replica::net {
namespace {

#if defined(_WIN32)
using NativeSocket = SOCKET;
constexpr NativeSocket kInvalidSocket = INVALID_SOCKET;
#else
using NativeSocket = int;
constexpr NativeSocket kInvalidSocket = -1;
#endif

void CloseNativeSocket(NativeSocket socket_handle) {
#if defined(_WIN32)
    closesocket(socket_handle);
#else
    close(socket_handle);
#endif
}

int LastSocketError() {
#if defined(_WIN32)
    return WSAGetLastError();
#else
    return errno;
#endif
}

bool IsWouldBlockError(int error_code) {
#if defined(_WIN32)
    return error_code == WSAEWOULDBLOCK;
#else
    return error_code == EWOULDBLOCK || error_code == EAGAIN;
#endif
}

bool IsConnectInProgressError(int error_code) {
#if defined(_WIN32)
    return error_code == WSAEWOULDBLOCK || error_code == WSAEINPROGRESS;
#else
    return error_code == EINPROGRESS;
#endif
}

std::string BuildSocketErrorMessage(const char* prefix, int error_code) {
#if defined(_WIN32)
    return std::string(prefix) + ", code=" + std::to_string(error_code);
#else
    return std::string(prefix) + ": " + std::string(std::strerror(error_code));
#endif
}

bool SetNonBlocking(NativeSocket socket_handle, std::string& out_error) {
#if defined(_WIN32)
    u_long mode = 1;
    if (ioctlsocket(socket_handle, FIONBIO, &mode) != 0) {
        out_error = BuildSocketErrorMessage("ioctlsocket(FIONBIO) failed", WSAGetLastError());
        return false;
    }
#else
    const int flags = fcntl(socket_handle, F_GETFL, 0);
    if (flags < 0) {
        out_error = BuildSocketErrorMessage("fcntl(F_GETFL) failed", errno);
        return false;
    }

    if (fcntl(socket_handle, F_SETFL, flags | O_NONBLOCK) < 0) {
        out_error = BuildSocketErrorMessage("fcntl(F_SETFL) failed", errno);
        return false;
    }
#endif

    out_error.clear();
    return true;
}

bool ResolveEndpoint(const TcpEndpoint& endpoint, sockaddr_in& out_address, std::string& out_error) {
    if (endpoint.port == 0) {
        out_error = "endpoint port must be non-zero";
        return false;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* resolved = nullptr;
    const int resolve_result = getaddrinfo(endpoint.host.c_str(), nullptr, &hints, &resolved);
    if (resolve_result != 0 || resolved == nullptr) {
        out_error = "cannot resolve host: " + endpoint.host;
        return false;
    }

    std::memset(&out_address, 0, sizeof(out_address));
    std::memcpy(&out_address, resolved->ai_addr, sizeof(out_address));
    out_address.sin_port = htons(endpoint.port);
    freeaddrinfo(resolved);

    out_error.clear();
    return true;
}

// Returns 1 when writable, 0 when still pending, -1 on failure.
int PollWritable(NativeSocket socket_handle) {
#if defined(_WIN32)
    WSAPOLLFD descriptor{};
    descriptor.fd = socket_handle;
    descriptor.events = POLLWRNORM;
    const int ready = WSAPoll(&descriptor, 1, 0);
#else
    pollfd descriptor{};
    descriptor.fd = socket_handle;
    descriptor.events = POLLOUT;
    const int ready = poll(&descriptor, 1, 0);
#endif
    if (ready < 0) {
        return -1;
    }
    return ready == 0 ? 0 : 1;
}

}  // namespace

struct TcpLineChannel::Impl final {
    enum class State {
        Closed,
        Connecting,
        Connected,
    };

    TcpEndpoint endpoint{};
    NativeSocket socket_handle = kInvalidSocket;
    State state = State::Closed;
    LineFramer framer;
    std::string outbound;
    std::deque<ChannelEvent> events;
#if defined(_WIN32)
    bool socket_subsystem_acquired = false;
#endif

    void Push(ChannelEventKind kind, std::string payload = {}) {
        events.push_back(ChannelEvent{.kind = kind, .payload = std::move(payload)});
    }

    void ReleaseSocket() {
        if (socket_handle != kInvalidSocket) {
            CloseNativeSocket(socket_handle);
            socket_handle = kInvalidSocket;
        }
#if defined(_WIN32)
        if (socket_subsystem_acquired) {
            WSACleanup();
            socket_subsystem_acquired = false;
        }
#endif
        state = State::Closed;
        framer.Clear();
        outbound.clear();
    }

    void Fail(const std::string& error_text) {
        Push(ChannelEventKind::Error, error_text);
        ReleaseSocket();
        Push(ChannelEventKind::Closed);
    }

    void AdvanceConnect() {
        const int writable = PollWritable(socket_handle);
        if (writable == 0) {
            return;
        }
        if (writable < 0) {
            Fail(BuildSocketErrorMessage("poll failed", LastSocketError()));
            return;
        }

        int socket_error = 0;
#if defined(_WIN32)
        int option_size = sizeof(socket_error);
        const int query_result = getsockopt(
            socket_handle, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&socket_error), &option_size);
#else
        socklen_t option_size = sizeof(socket_error);
        const int query_result = getsockopt(socket_handle, SOL_SOCKET, SO_ERROR, &socket_error, &option_size);
#endif
        if (query_result != 0) {
            Fail(BuildSocketErrorMessage("getsockopt(SO_ERROR) failed", LastSocketError()));
            return;
        }
        if (socket_error != 0) {
            Fail(BuildSocketErrorMessage("connect failed", socket_error));
            return;
        }

        state = State::Connected;
        Push(ChannelEventKind::Opened);
    }

    bool Flush(std::string& out_error) {
        while (!outbound.empty()) {
#if defined(_WIN32)
            const int sent = send(socket_handle, outbound.data(), static_cast<int>(outbound.size()), 0);
#else
            const ssize_t sent = send(socket_handle, outbound.data(), outbound.size(), MSG_NOSIGNAL);
#endif
            if (sent < 0) {
                const int socket_error = LastSocketError();
                if (IsWouldBlockError(socket_error)) {
                    break;
                }
                out_error = BuildSocketErrorMessage("send failed", socket_error);
                return false;
            }
            outbound.erase(0, static_cast<std::size_t>(sent));
        }

        out_error.clear();
        return true;
    }

    void Receive() {
        std::array<char, 65536> receive_buffer{};
        while (state == State::Connected) {
#if defined(_WIN32)
            const int received =
                recv(socket_handle, receive_buffer.data(), static_cast<int>(receive_buffer.size()), 0);
#else
            const ssize_t received = recv(socket_handle, receive_buffer.data(), receive_buffer.size(), 0);
#endif
            if (received == 0) {
                ReleaseSocket();
                Push(ChannelEventKind::Closed);
                return;
            }
            if (received < 0) {
                const int socket_error = LastSocketError();
                if (!IsWouldBlockError(socket_error)) {
                    Fail(BuildSocketErrorMessage("recv failed", socket_error));
                }
                return;
            }

            std::string framing_error;
            if (!framer.Append(
                    std::string_view(receive_buffer.data(), static_cast<std::size_t>(received)),
                    framing_error)) {
                Fail(framing_error);
                return;
            }

            std::string line;
            while (framer.PopLine(line)) {
                // Blank lines carry no message.
                if (!line.empty()) {
                    Push(ChannelEventKind::Message, std::move(line));
                }
                line.clear();
            }
        }
    }
};

TcpLineChannel::TcpLineChannel(TcpEndpoint endpoint)
    : impl_(std::make_unique<Impl>()) {
    impl_->endpoint = std::move(endpoint);
}

TcpLineChannel::~TcpLineChannel() {
    Close();
}

bool TcpLineChannel::Open(std::string& out_error) {
    Close();
    impl_->events.clear();

#if defined(_WIN32)
    WSADATA wsa_data{};
    const int startup_result = WSAStartup(MAKEWORD(2, 2), &wsa_data);
    if (startup_result != 0) {
        out_error = "WSAStartup failed, code=" + std::to_string(startup_result);
        return false;
    }
    impl_->socket_subsystem_acquired = true;
#endif

    sockaddr_in remote_address{};
    if (!ResolveEndpoint(impl_->endpoint, remote_address, out_error)) {
        impl_->ReleaseSocket();
        return false;
    }

    NativeSocket socket_handle = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (socket_handle == kInvalidSocket) {
        out_error = BuildSocketErrorMessage("socket creation failed", LastSocketError());
        impl_->ReleaseSocket();
        return false;
    }
    impl_->socket_handle = socket_handle;

    if (!SetNonBlocking(socket_handle, out_error)) {
        impl_->ReleaseSocket();
        return false;
    }

    const int no_delay = 1;
    (void)setsockopt(
        socket_handle, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&no_delay), sizeof(no_delay));

    const int connect_result = connect(
        socket_handle,
        reinterpret_cast<const sockaddr*>(&remote_address),
        sizeof(remote_address));
    if (connect_result == 0) {
        impl_->state = Impl::State::Connected;
        impl_->Push(ChannelEventKind::Opened);
        out_error.clear();
        return true;
    }

    const int connect_error = LastSocketError();
    if (!IsConnectInProgressError(connect_error)) {
        out_error = BuildSocketErrorMessage("connect failed", connect_error);
        impl_->ReleaseSocket();
        return false;
    }

    impl_->state = Impl::State::Connecting;
    out_error.clear();
    return true;
}

void TcpLineChannel::Close() {
    if (impl_ == nullptr || impl_->state == Impl::State::Closed) {
        return;
    }

    impl_->ReleaseSocket();
    impl_->Push(ChannelEventKind::Closed);
}

bool TcpLineChannel::IsOpen() const {
    return impl_ != nullptr && impl_->state != Impl::State::Closed;
}

bool TcpLineChannel::IsConnected() const {
    return impl_ != nullptr && impl_->state == Impl::State::Connected;
}

const TcpEndpoint& TcpLineChannel::Endpoint() const {
    return impl_->endpoint;
}

bool TcpLineChannel::Send(std::string_view message, std::string& out_error) {
    if (!IsConnected()) {
        out_error = "channel is not connected";
        return false;
    }
    if (message.find('\n') != std::string_view::npos) {
        out_error = "message must not contain a line break";
        return false;
    }

    impl_->outbound.append(message.data(), message.size());
    impl_->outbound.push_back('\n');
    if (!impl_->Flush(out_error)) {
        impl_->Fail(out_error);
        return false;
    }
    return true;
}

bool TcpLineChannel::PollEvent(ChannelEvent& out_event) {
    if (impl_->state == Impl::State::Connecting) {
        impl_->AdvanceConnect();
    }

    if (impl_->state == Impl::State::Connected) {
        std::string flush_error;
        if (!impl_->Flush(flush_error)) {
            impl_->Fail(flush_error);
        } else {
            impl_->Receive();
        }
    }

    if (impl_->events.empty()) {
        return false;
    }

    out_event = std::move(impl_->events.front());
    impl_->events.pop_front();
    return true;
}

}  // namespace replica::net
