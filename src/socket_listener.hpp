// =============================================================================
// CastLink - Socket Listener (receiver side)
// =============================================================================
// Accepts inbound TCP carriers on the mirroring port and hands each one out
// as a connected SocketTransport, ready for Session::attach().
// =============================================================================
#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "castlink_protocol.hpp"
#include "socket_transport.hpp"

namespace castlink {

class SocketListener {
public:
    SocketListener() = default;
    ~SocketListener();

    // Port 0 picks an ephemeral port; see port()
    Result<void> listen(const std::string& bind_address = "0.0.0.0",
                        uint16_t port = protocol::DEFAULT_WIFI_PORT);

    // Blocks until a peer connects or close() is called (IoError)
    Result<std::unique_ptr<SocketTransport>> accept();

    void close();

    uint16_t port() const { return port_; }

private:
    StreamSocket socket_;
    uint16_t port_ = 0;
    std::atomic<bool> listening_{false};
};

} // namespace castlink
