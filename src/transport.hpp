// =============================================================================
// CastLink - Transport Abstraction
// =============================================================================
// A carrier that moves raw bytes between the phone and the receiver. The
// session above sees only this interface; Wi-Fi TCP and Bluetooth RFCOMM are
// interchangeable variants behind it.
//
// Contract:
//   - receive() blocks until at least one byte or end of stream. End of stream
//     is reported as PeerClosed, distinct from IoError.
//   - close() may be called from any thread at any time and promptly unblocks
//     a pending connect/send/receive on another thread. Idempotent.
//   - No retry inside a transport; reconnect policy belongs to the owner.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "result.hpp"

namespace castlink {

enum class TransportKind { WifiSocket, Bluetooth };

inline const char* transportKindName(TransportKind k) {
    switch (k) {
        case TransportKind::WifiSocket: return "wifi";
        case TransportKind::Bluetooth:  return "bluetooth";
    }
    return "wifi";
}

class Transport {
public:
    virtual ~Transport() = default;

    virtual TransportKind kind() const = 0;

    // Wi-Fi: "host[:port]". Bluetooth: "AA:BB:CC:DD:EE:FF[#channel]".
    virtual Result<void> connect(const std::string& target) = 0;

    // Writes the whole buffer or fails
    virtual Result<void> send(const uint8_t* data, size_t len) = 0;

    // Returns bytes read (> 0), or PeerClosed / IoError
    virtual Result<size_t> receive(uint8_t* buf, size_t cap) = 0;

    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<Transport>(TransportKind)>;

// Builds SocketTransport / BluetoothTransport
std::unique_ptr<Transport> makeTransport(TransportKind kind);
TransportFactory defaultTransportFactory();

} // namespace castlink
