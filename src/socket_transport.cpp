#include "socket_transport.hpp"

#include <chrono>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#endif

#include "castlink_log.hpp"

namespace castlink {

Result<SocketTarget> parseSocketTarget(const std::string& target) {
    SocketTarget out;
    std::string port_str;

    if (!target.empty() && target[0] == '[') {
        size_t close = target.find(']');
        if (close == std::string::npos) {
            return Err<SocketTarget>(ErrorKind::InvalidArgument, "unterminated '[' in " + target);
        }
        out.host = target.substr(1, close - 1);
        if (close + 1 < target.size()) {
            if (target[close + 1] != ':') {
                return Err<SocketTarget>(ErrorKind::InvalidArgument, "bad target " + target);
            }
            port_str = target.substr(close + 2);
        }
    } else {
        size_t colon = target.find(':');
        if (colon != std::string::npos && target.find(':', colon + 1) == std::string::npos) {
            out.host = target.substr(0, colon);
            port_str = target.substr(colon + 1);
        } else {
            // No port, or a bare IPv6 literal
            out.host = target;
        }
    }

    if (out.host.empty()) {
        return Err<SocketTarget>(ErrorKind::InvalidArgument, "empty host in target '" + target + "'");
    }

    if (!port_str.empty()) {
        char* end = nullptr;
        long port = strtol(port_str.c_str(), &end, 10);
        if (*end != '\0' || port < 1 || port > 65535) {
            return Err<SocketTarget>(ErrorKind::InvalidArgument, "bad port '" + port_str + "'");
        }
        out.port = static_cast<uint16_t>(port);
    }
    return Ok(out);
}

SocketTransport::SocketTransport(int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms) {}

SocketTransport::~SocketTransport() {
    close();
}

std::unique_ptr<SocketTransport> SocketTransport::fromAccepted(StreamSocket::Handle handle,
                                                               std::string peer) {
    auto t = std::make_unique<SocketTransport>();
    t->socket_ = std::make_unique<StreamSocket>();
    t->socket_->adopt(handle);
    t->peer_ = std::move(peer);
    return t;
}

StreamSocket* SocketTransport::current() {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    return socket_.get();
}

Result<void> SocketTransport::connect(const std::string& target) {
    auto parsed = parseSocketTarget(target);
    if (parsed.is_err()) return parsed.error();
    const SocketTarget& t = parsed.value();

    if (!ensureSocketRuntime()) {
        return Err<void>(ErrorKind::IoError, "socket runtime initialization failed");
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(t.port);
    int gai = getaddrinfo(t.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Err<void>(ErrorKind::InvalidArgument,
                         "cannot resolve '" + t.host + "': " + gai_strerror(gai), gai);
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard(res, &freeaddrinfo);

    CLOG_INFO("wifi", "Connecting to %s:%u", t.host.c_str(), t.port);

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::milliseconds(connect_timeout_ms_);
    Error last(ErrorKind::ConnectTimeout, "no address attempted");

    for (addrinfo* ai = res; ai; ai = ai->ai_next) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            last = Error(ErrorKind::ConnectTimeout,
                         "no answer within " + std::to_string(connect_timeout_ms_) + " ms");
            break;
        }

        StreamSocket* sock = nullptr;
        {
            std::lock_guard<std::mutex> lock(sock_mtx_);
            if (closed_.load()) {
                return Err<void>(ErrorKind::IoError, "transport closed during connect");
            }
            socket_ = std::make_unique<StreamSocket>();
            sock = socket_.get();
        }

        auto opened = sock->open(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (opened.is_err()) {
            last = opened.error();
            continue;
        }

        auto rc = sock->connect(ai->ai_addr, static_cast<StreamSocket::AddrLen>(ai->ai_addrlen),
                                static_cast<int>(remaining));
        if (rc.is_ok()) {
            int one = 1;
            setsockopt(sock->handle(), IPPROTO_TCP, TCP_NODELAY,
                       reinterpret_cast<const char*>(&one), sizeof(one));
            peer_ = t.host + ":" + port;
            CLOG_INFO("wifi", "Connected to %s", peer_.c_str());
            return Ok();
        }
        last = rc.error();
        if (closed_.load()) break;
    }

    CLOG_WARN("wifi", "Connect to %s failed: %s (%s)", target.c_str(),
              last.message.c_str(), errorKindName(last.kind));
    return last;
}

Result<void> SocketTransport::send(const uint8_t* data, size_t len) {
    StreamSocket* sock = current();
    if (!sock) return Err<void>(ErrorKind::IoError, "send before connect");
    return sock->sendAll(data, len);
}

Result<size_t> SocketTransport::receive(uint8_t* buf, size_t cap) {
    StreamSocket* sock = current();
    if (!sock) return Err<size_t>(ErrorKind::IoError, "receive before connect");
    return sock->receive(buf, cap);
}

void SocketTransport::close() {
    std::lock_guard<std::mutex> lock(sock_mtx_);
    closed_.store(true);
    if (socket_) socket_->close();
}

} // namespace castlink
