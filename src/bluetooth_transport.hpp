// =============================================================================
// CastLink - Bluetooth RFCOMM Transport
// =============================================================================
// RFCOMM carrier to the mirroring service (UUID 00001101-...-00805F9B34FB).
// Target is "AA:BB:CC:DD:EE:FF", optionally "AA:BB:CC:DD:EE:FF#<channel>" to
// skip the SDP channel lookup.
//
// Linux: BlueZ (built only when libbluetooth is found).
// Windows: Winsock AF_BTH; the stack resolves the service UUID itself.
// =============================================================================
#pragma once
#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "castlink_protocol.hpp"
#include "stream_socket.hpp"
#include "transport.hpp"

namespace castlink {

struct BluetoothTarget {
    std::array<uint8_t, 6> address{};  // in display order (AA first)
    int channel = -1;                  // -1 = look up via SDP
};

// InvalidArgument on anything but six ':'-separated hex octets and an
// optional channel in 1..30
Result<BluetoothTarget> parseBluetoothTarget(const std::string& target);

// Whether this build carries a Bluetooth stack
bool bluetoothSupported();

class BluetoothTransport : public Transport {
public:
    explicit BluetoothTransport(int connect_timeout_ms = protocol::BLUETOOTH_CONNECT_TIMEOUT_MS);
    ~BluetoothTransport() override;

    TransportKind kind() const override { return TransportKind::Bluetooth; }

    Result<void> connect(const std::string& target) override;
    Result<void> send(const uint8_t* data, size_t len) override;
    Result<size_t> receive(uint8_t* buf, size_t cap) override;
    void close() override;

private:
    int connect_timeout_ms_;
    StreamSocket socket_;
    std::atomic<bool> connected_{false};
};

} // namespace castlink
