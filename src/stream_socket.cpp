#include "stream_socket.hpp"

#include <chrono>
#include <cstring>
#include <string>

#ifdef _WIN32
#pragma comment(lib, "ws2_32.lib")
#define SOCK_EINPROGRESS WSAEWOULDBLOCK
#define SOCK_EINTR WSAEINTR
#define SOCK_ECONNREFUSED WSAECONNREFUSED
#define SOCK_ETIMEDOUT WSAETIMEDOUT
#define SOCK_POLL WSAPoll
#define SOCK_SEND_FLAGS 0
#else
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#define closesocket ::close
#define SOCK_EINPROGRESS EINPROGRESS
#define SOCK_EINTR EINTR
#define SOCK_ECONNREFUSED ECONNREFUSED
#define SOCK_ETIMEDOUT ETIMEDOUT
#define SOCK_POLL poll
#define SOCK_SEND_FLAGS MSG_NOSIGNAL
#endif

#include "castlink_log.hpp"

namespace castlink {

namespace {

constexpr int CONNECT_POLL_SLICE_MS = 100;

std::string osErrorText(int err) {
#ifdef _WIN32
    return "WSA error " + std::to_string(err);
#else
    return std::strerror(err);
#endif
}

} // anonymous namespace

bool ensureSocketRuntime() {
#ifdef _WIN32
    static const bool ok = [] {
        WSADATA wsa;
        return WSAStartup(MAKEWORD(2, 2), &wsa) == 0;
    }();
    return ok;
#else
    return true;
#endif
}

int StreamSocket::lastError() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

StreamSocket::StreamSocket() = default;

StreamSocket::~StreamSocket() {
    std::lock_guard<std::mutex> lock(fd_mtx_);
    if (fd_ != INVALID_HANDLE) {
        closesocket(fd_);
        fd_ = INVALID_HANDLE;
    }
}

Result<void> StreamSocket::open(int family, int type, int protocol) {
    if (!ensureSocketRuntime()) {
        return Err<void>(ErrorKind::IoError, "socket runtime initialization failed");
    }

    std::lock_guard<std::mutex> lock(fd_mtx_);
    if (closed_.load()) {
        return Err<void>(ErrorKind::IoError, "socket closed before open");
    }
    if (fd_ != INVALID_HANDLE) {
        return Err<void>(ErrorKind::InvalidArgument, "socket already open");
    }

    fd_ = ::socket(family, type, protocol);
    if (fd_ == INVALID_HANDLE) {
        int err = lastError();
        return Err<void>(ErrorKind::IoError, "socket() failed: " + osErrorText(err), err);
    }
    return Ok();
}

void StreamSocket::adopt(Handle handle) {
    std::lock_guard<std::mutex> lock(fd_mtx_);
    if (fd_ != INVALID_HANDLE) closesocket(fd_);
    fd_ = handle;
    closed_.store(false);
}

Result<void> StreamSocket::setBlocking(bool blocking) {
#ifdef _WIN32
    u_long mode = blocking ? 0 : 1;
    if (ioctlsocket(fd_, FIONBIO, &mode) != 0) {
        int err = lastError();
        return Err<void>(ErrorKind::IoError, "ioctlsocket(FIONBIO) failed", err);
    }
#else
    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags < 0) {
        int err = lastError();
        return Err<void>(ErrorKind::IoError, "fcntl(F_GETFL) failed: " + osErrorText(err), err);
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(fd_, F_SETFL, flags) < 0) {
        int err = lastError();
        return Err<void>(ErrorKind::IoError, "fcntl(F_SETFL) failed: " + osErrorText(err), err);
    }
#endif
    return Ok();
}

Result<void> StreamSocket::connect(const sockaddr* addr, AddrLen len, int timeout_ms) {
    if (fd_ == INVALID_HANDLE) {
        return Err<void>(ErrorKind::IoError, "connect on unopened socket");
    }

    auto nb = setBlocking(false);
    if (nb.is_err()) return nb;

    int rc = ::connect(fd_, addr, len);
    if (rc != 0) {
        int err = lastError();
#ifdef _WIN32
        bool pending = (err == WSAEWOULDBLOCK || err == WSAEINPROGRESS);
#else
        bool pending = (err == EINPROGRESS || err == EINTR);
#endif
        if (!pending) {
            if (err == SOCK_ECONNREFUSED) {
                return Err<void>(ErrorKind::ConnectRefused, "connection refused", err);
            }
            return Err<void>(ErrorKind::IoError, "connect failed: " + osErrorText(err), err);
        }

        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        for (;;) {
            if (closed_.load()) {
                return Err<void>(ErrorKind::IoError, "connect aborted by close");
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                return Err<void>(ErrorKind::ConnectTimeout,
                                 "no answer within " + std::to_string(timeout_ms) + " ms");
            }

#ifdef _WIN32
            WSAPOLLFD pfd{};
#else
            pollfd pfd{};
#endif
            pfd.fd = fd_;
            pfd.events = POLLOUT;
            int slice = static_cast<int>(remaining < CONNECT_POLL_SLICE_MS ? remaining : CONNECT_POLL_SLICE_MS);
            int n = SOCK_POLL(&pfd, 1, slice);
            if (n < 0) {
                int perr = lastError();
                if (perr == SOCK_EINTR) continue;
                return Err<void>(ErrorKind::IoError, "poll failed: " + osErrorText(perr), perr);
            }
            if (n == 0) continue;

            int so_error = 0;
            AddrLen so_len = sizeof(so_error);
            if (getsockopt(fd_, SOL_SOCKET, SO_ERROR,
                           reinterpret_cast<char*>(&so_error), &so_len) != 0) {
                int gerr = lastError();
                return Err<void>(ErrorKind::IoError, "getsockopt(SO_ERROR) failed", gerr);
            }
            if (closed_.load()) {
                return Err<void>(ErrorKind::IoError, "connect aborted by close");
            }
            if (so_error == 0) break;
            if (so_error == SOCK_ECONNREFUSED) {
                return Err<void>(ErrorKind::ConnectRefused, "connection refused", so_error);
            }
            if (so_error == SOCK_ETIMEDOUT) {
                return Err<void>(ErrorKind::ConnectTimeout, "connect timed out", so_error);
            }
            return Err<void>(ErrorKind::IoError, "connect failed: " + osErrorText(so_error), so_error);
        }
    }

    return setBlocking(true);
}

Result<void> StreamSocket::sendAll(const uint8_t* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        if (closed_.load()) {
            return Err<void>(ErrorKind::IoError, "send on closed transport");
        }
        size_t chunk = len - sent;
#ifdef _WIN32
        if (chunk > 0x7fffffff) chunk = 0x7fffffff;
        int n = ::send(fd_, reinterpret_cast<const char*>(data + sent), static_cast<int>(chunk), 0);
#else
        ssize_t n = ::send(fd_, data + sent, chunk, SOCK_SEND_FLAGS);
#endif
        if (n < 0) {
            int err = lastError();
            if (err == SOCK_EINTR) continue;
            return Err<void>(ErrorKind::IoError, "send failed: " + osErrorText(err), err);
        }
        sent += static_cast<size_t>(n);
    }
    return Ok();
}

Result<size_t> StreamSocket::receive(uint8_t* buf, size_t cap) {
    for (;;) {
#ifdef _WIN32
        int n = ::recv(fd_, reinterpret_cast<char*>(buf), static_cast<int>(cap), 0);
#else
        ssize_t n = ::recv(fd_, buf, cap, 0);
#endif
        if (n > 0) return Ok(static_cast<size_t>(n));
        if (closed_.load()) {
            return Err<size_t>(ErrorKind::IoError, "transport closed locally");
        }
        if (n == 0) {
            return Err<size_t>(ErrorKind::PeerClosed, "peer closed the stream");
        }
        int err = lastError();
        if (err == SOCK_EINTR) continue;
        return Err<size_t>(ErrorKind::IoError, "recv failed: " + osErrorText(err), err);
    }
}

void StreamSocket::close() {
    if (closed_.exchange(true)) return;

    std::lock_guard<std::mutex> lock(fd_mtx_);
    if (fd_ != INVALID_HANDLE) {
#ifdef _WIN32
        shutdown(fd_, SD_BOTH);
#else
        shutdown(fd_, SHUT_RDWR);
#endif
    }
}

} // namespace castlink
