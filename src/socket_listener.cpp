#include "socket_listener.hpp"

#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <cerrno>
#endif

#include "castlink_log.hpp"

namespace castlink {

SocketListener::~SocketListener() {
    close();
}

Result<void> SocketListener::listen(const std::string& bind_address, uint16_t port) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        return Err<void>(ErrorKind::InvalidArgument, "bad bind address '" + bind_address + "'");
    }

    auto opened = socket_.open(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (opened.is_err()) return opened;

    int one = 1;
    setsockopt(socket_.handle(), SOL_SOCKET, SO_REUSEADDR,
               reinterpret_cast<const char*>(&one), sizeof(one));

    if (::bind(socket_.handle(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = StreamSocket::lastError();
        return Err<void>(ErrorKind::IoError,
                         "bind " + bind_address + ":" + std::to_string(port) + " failed", err);
    }
    if (::listen(socket_.handle(), 1) != 0) {
        int err = StreamSocket::lastError();
        return Err<void>(ErrorKind::IoError, "listen failed", err);
    }

    sockaddr_in bound{};
    StreamSocket::AddrLen len = sizeof(bound);
    if (getsockname(socket_.handle(), reinterpret_cast<sockaddr*>(&bound), &len) == 0) {
        port_ = ntohs(bound.sin_port);
    } else {
        port_ = port;
    }

    listening_.store(true);
    CLOG_INFO("listener", "Listening on %s:%u", bind_address.c_str(), port_);
    return Ok();
}

Result<std::unique_ptr<SocketTransport>> SocketListener::accept() {
    using Out = std::unique_ptr<SocketTransport>;
    if (!listening_.load()) {
        return Err<Out>(ErrorKind::IoError, "accept on a listener that is not listening");
    }

    for (;;) {
        sockaddr_in peer{};
        StreamSocket::AddrLen len = sizeof(peer);
        StreamSocket::Handle h = ::accept(socket_.handle(), reinterpret_cast<sockaddr*>(&peer), &len);
        if (h != StreamSocket::INVALID_HANDLE) {
            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
            std::string name = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));

            int one = 1;
            setsockopt(h, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char*>(&one), sizeof(one));

            CLOG_INFO("listener", "Accepted %s", name.c_str());
            return Ok(SocketTransport::fromAccepted(h, std::move(name)));
        }

        int err = StreamSocket::lastError();
        if (socket_.isClosed()) {
            return Err<Out>(ErrorKind::IoError, "listener closed");
        }
#ifndef _WIN32
        if (err == EINTR || err == ECONNABORTED) continue;
#endif
        return Err<Out>(ErrorKind::IoError, "accept failed", err);
    }
}

void SocketListener::close() {
    listening_.store(false);
    socket_.close();
}

} // namespace castlink
