// =============================================================================
// CastLink - Wi-Fi Socket Transport
// =============================================================================
// TCP carrier. Target is "host[:port]" ("[v6addr]:port" for IPv6 literals);
// the port defaults to 9295.
// =============================================================================
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "castlink_protocol.hpp"
#include "stream_socket.hpp"
#include "transport.hpp"

namespace castlink {

struct SocketTarget {
    std::string host;
    uint16_t port = protocol::DEFAULT_WIFI_PORT;
};

// InvalidArgument on empty host or a port outside 1..65535
Result<SocketTarget> parseSocketTarget(const std::string& target);

class SocketTransport : public Transport {
public:
    explicit SocketTransport(int connect_timeout_ms = protocol::WIFI_CONNECT_TIMEOUT_MS);
    ~SocketTransport() override;

    // Wrap a connection produced by SocketListener::accept()
    static std::unique_ptr<SocketTransport> fromAccepted(StreamSocket::Handle handle,
                                                         std::string peer);

    TransportKind kind() const override { return TransportKind::WifiSocket; }

    Result<void> connect(const std::string& target) override;
    Result<void> send(const uint8_t* data, size_t len) override;
    Result<size_t> receive(uint8_t* buf, size_t cap) override;
    void close() override;

    const std::string& peer() const { return peer_; }

private:
    StreamSocket* current();

    int connect_timeout_ms_;
    std::string peer_;

    std::mutex sock_mtx_;
    std::unique_ptr<StreamSocket> socket_;
    std::atomic<bool> closed_{false};
};

} // namespace castlink
