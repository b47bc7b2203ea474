#include "bluetooth_transport.hpp"

#include <cctype>
#include <cstdlib>
#include <cstring>

#ifdef _WIN32
#include <ws2bth.h>
#pragma comment(lib, "ws2_32.lib")
#elif defined(CASTLINK_HAVE_BLUEZ)
#include <bluetooth/bluetooth.h>
#include <bluetooth/rfcomm.h>
#include <bluetooth/sdp.h>
#include <bluetooth/sdp_lib.h>
#include <cerrno>
#endif

#include "castlink_log.hpp"

namespace castlink {

using namespace protocol;

Result<BluetoothTarget> parseBluetoothTarget(const std::string& target) {
    BluetoothTarget out;

    std::string addr = target;
    size_t hash = target.find('#');
    if (hash != std::string::npos) {
        addr = target.substr(0, hash);
        std::string ch = target.substr(hash + 1);
        char* end = nullptr;
        long channel = ch.empty() ? 0 : strtol(ch.c_str(), &end, 10);
        if (ch.empty() || *end != '\0' || channel < 1 || channel > 30) {
            return Err<BluetoothTarget>(ErrorKind::InvalidArgument,
                                        "bad RFCOMM channel '" + ch + "'");
        }
        out.channel = static_cast<int>(channel);
    }

    if (addr.size() != 17) {
        return Err<BluetoothTarget>(ErrorKind::InvalidArgument,
                                    "bad Bluetooth address '" + addr + "'");
    }
    for (size_t i = 0; i < 6; i++) {
        const char hi = addr[i * 3];
        const char lo = addr[i * 3 + 1];
        if (!std::isxdigit(static_cast<unsigned char>(hi)) ||
            !std::isxdigit(static_cast<unsigned char>(lo)) ||
            (i < 5 && addr[i * 3 + 2] != ':')) {
            return Err<BluetoothTarget>(ErrorKind::InvalidArgument,
                                        "bad Bluetooth address '" + addr + "'");
        }
        char octet[3] = {hi, lo, '\0'};
        out.address[i] = static_cast<uint8_t>(strtoul(octet, nullptr, 16));
    }
    return Ok(out);
}

bool bluetoothSupported() {
#if defined(_WIN32) || defined(CASTLINK_HAVE_BLUEZ)
    return true;
#else
    return false;
#endif
}

namespace {

#if defined(_WIN32)

GUID serviceGuid() {
    const uint8_t* u = BLUETOOTH_SERVICE_UUID_BYTES;
    GUID g;
    g.Data1 = get_u32_be(u);
    g.Data2 = static_cast<unsigned short>((u[4] << 8) | u[5]);
    g.Data3 = static_cast<unsigned short>((u[6] << 8) | u[7]);
    memcpy(g.Data4, u + 8, 8);
    return g;
}

bool isPairingError(int err) {
    return err == WSAEACCES;
}

#elif defined(CASTLINK_HAVE_BLUEZ)

bool isPairingError(int err) {
    return err == EACCES || err == EPERM || err == EKEYREJECTED;
}

// SDP lookup of the RFCOMM channel serving the mirroring UUID. Returns the
// channel, or an error with the errno of the failed step.
Result<int> findServiceChannel(const bdaddr_t& device) {
    bdaddr_t any{};
    bdaddr_t target = device;
    sdp_session_t* session = sdp_connect(&any, &target, SDP_RETRY_IF_BUSY);
    if (!session) {
        int err = errno;
        if (isPairingError(err)) {
            return Err<int>(ErrorKind::PairingRequired, "SDP refused: peer not paired", err);
        }
        if (err == EHOSTDOWN || err == ETIMEDOUT) {
            return Err<int>(ErrorKind::ConnectTimeout, "device not reachable for SDP", err);
        }
        return Err<int>(ErrorKind::IoError, std::string("SDP connect failed: ") + strerror(err), err);
    }

    uuid_t svc_uuid;
    sdp_uuid128_create(&svc_uuid, BLUETOOTH_SERVICE_UUID_BYTES);
    sdp_list_t* search = sdp_list_append(nullptr, &svc_uuid);
    uint32_t range = 0x0000ffff;
    sdp_list_t* attrs = sdp_list_append(nullptr, &range);
    sdp_list_t* records = nullptr;

    int channel = -1;
    int rc = sdp_service_search_attr_req(session, search, SDP_ATTR_REQ_RANGE, attrs, &records);
    if (rc == 0) {
        for (sdp_list_t* r = records; r; r = r->next) {
            sdp_record_t* rec = static_cast<sdp_record_t*>(r->data);
            sdp_list_t* protos = nullptr;
            if (channel < 0 && sdp_get_access_protos(rec, &protos) == 0) {
                int port = sdp_get_proto_port(protos, RFCOMM_UUID);
                if (port > 0) channel = port;
                for (sdp_list_t* p = protos; p; p = p->next) {
                    sdp_list_free(static_cast<sdp_list_t*>(p->data), nullptr);
                }
                sdp_list_free(protos, nullptr);
            }
            sdp_record_free(rec);
        }
    }
    sdp_list_free(records, nullptr);
    sdp_list_free(search, nullptr);
    sdp_list_free(attrs, nullptr);
    sdp_close(session);

    if (rc != 0) {
        return Err<int>(ErrorKind::IoError, "SDP search failed", rc);
    }
    if (channel < 0) {
        return Err<int>(ErrorKind::ConnectRefused, "mirroring service not registered on device");
    }
    return Ok(channel);
}

#endif

} // anonymous namespace

BluetoothTransport::BluetoothTransport(int connect_timeout_ms)
    : connect_timeout_ms_(connect_timeout_ms) {}

BluetoothTransport::~BluetoothTransport() {
    close();
}

Result<void> BluetoothTransport::connect(const std::string& target) {
    auto parsed = parseBluetoothTarget(target);
    if (parsed.is_err()) return parsed.error();

#if defined(_WIN32) || defined(CASTLINK_HAVE_BLUEZ)
    const BluetoothTarget& t = parsed.value();

#if defined(_WIN32)
    auto opened = socket_.open(AF_BTH, SOCK_STREAM, BTHPROTO_RFCOMM);
    if (opened.is_err()) return opened;

    SOCKADDR_BTH sa{};
    sa.addressFamily = AF_BTH;
    for (int i = 0; i < 6; i++) {
        sa.btAddr = (sa.btAddr << 8) | t.address[i];
    }
    if (t.channel > 0) {
        sa.port = static_cast<ULONG>(t.channel);
    } else {
        sa.serviceClassId = serviceGuid();
        sa.port = 0;
    }
    const sockaddr* addr = reinterpret_cast<const sockaddr*>(&sa);
    StreamSocket::AddrLen addr_len = sizeof(sa);
#else
    sockaddr_rc sa{};
    sa.rc_family = AF_BLUETOOTH;
    for (int i = 0; i < 6; i++) {
        sa.rc_bdaddr.b[i] = t.address[5 - i];
    }

    int channel = t.channel;
    if (channel < 0) {
        auto found = findServiceChannel(sa.rc_bdaddr);
        if (found.is_err()) {
            CLOG_WARN("bt", "Service lookup on %s failed: %s", target.c_str(),
                      found.error().message.c_str());
            return found.error();
        }
        channel = found.value();
        CLOG_DEBUG("bt", "Service found on RFCOMM channel %d", channel);
    }
    sa.rc_channel = static_cast<uint8_t>(channel);

    auto opened = socket_.open(AF_BLUETOOTH, SOCK_STREAM, BTPROTO_RFCOMM);
    if (opened.is_err()) return opened;

    // Authenticated link: an unpaired peer fails the connect with EACCES
    bt_security sec{};
    sec.level = BT_SECURITY_MEDIUM;
    if (setsockopt(socket_.handle(), SOL_BLUETOOTH, BT_SECURITY, &sec, sizeof(sec)) != 0) {
        CLOG_WARN("bt", "BT_SECURITY not applied (errno=%d)", errno);
    }
    const sockaddr* addr = reinterpret_cast<const sockaddr*>(&sa);
    StreamSocket::AddrLen addr_len = sizeof(sa);
#endif

    CLOG_INFO("bt", "Connecting RFCOMM to %s", target.c_str());
    auto rc = socket_.connect(addr, addr_len, connect_timeout_ms_);
    if (rc.is_err()) {
        Error err = rc.error();
        if (err.kind == ErrorKind::IoError && isPairingError(err.code)) {
            err = Error(ErrorKind::PairingRequired, "peer is not paired/authenticated", err.code);
        }
#ifndef _WIN32
        else if (err.kind == ErrorKind::IoError && err.code == EHOSTDOWN) {
            err = Error(ErrorKind::ConnectTimeout, "device not reachable", err.code);
        }
#endif
        CLOG_WARN("bt", "RFCOMM connect to %s failed: %s (%s)", target.c_str(),
                  err.message.c_str(), errorKindName(err.kind));
        return err;
    }

    connected_.store(true);
    CLOG_INFO("bt", "Connected to %s", target.c_str());
    return Ok();
#else
    CLOG_ERROR("bt", "Bluetooth requested but this build has no Bluetooth stack");
    return Err<void>(ErrorKind::IoError, "Bluetooth support not available in this build");
#endif
}

Result<void> BluetoothTransport::send(const uint8_t* data, size_t len) {
    if (!connected_.load()) return Err<void>(ErrorKind::IoError, "send before connect");
    return socket_.sendAll(data, len);
}

Result<size_t> BluetoothTransport::receive(uint8_t* buf, size_t cap) {
    if (!connected_.load()) return Err<size_t>(ErrorKind::IoError, "receive before connect");
    return socket_.receive(buf, cap);
}

void BluetoothTransport::close() {
    socket_.close();
}

} // namespace castlink
