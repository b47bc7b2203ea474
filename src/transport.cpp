#include "transport.hpp"

#include "bluetooth_transport.hpp"
#include "socket_transport.hpp"

namespace castlink {

std::unique_ptr<Transport> makeTransport(TransportKind kind) {
    switch (kind) {
        case TransportKind::WifiSocket: return std::make_unique<SocketTransport>();
        case TransportKind::Bluetooth:  return std::make_unique<BluetoothTransport>();
    }
    return nullptr;
}

TransportFactory defaultTransportFactory() {
    return [](TransportKind kind) { return makeTransport(kind); };
}

} // namespace castlink
