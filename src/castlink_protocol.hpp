// =============================================================================
// CastLink - Protocol Constants & Utilities
// =============================================================================
// Shared wire definitions for the mirroring stream. Both carriers (TCP socket
// and Bluetooth RFCOMM) carry the same byte stream.
//
// Video frame:
//   type:      1 byte  (0x01)
//   size:      4 bytes (BE, payload length)
//   flags:     4 bytes (BE, opaque encoder flags)
//   timestamp: 8 bytes (BE, signed presentation time in microseconds)
//   payload:   size bytes = nonce(12) || ciphertext || tag(16)
//
// Input frame:
//   type:      1 byte  (0x02)
//   name_len:  1 byte
//   name:      name_len bytes ASCII ("button" / "axis" / "touchpad")
//   code:      4 bytes (BE, signed)
//   value:     4 bytes (BE, IEEE-754 bit pattern)
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <cstring>

namespace castlink::protocol {

// Carrier defaults
static constexpr uint16_t DEFAULT_WIFI_PORT = 9295;
static constexpr int WIFI_CONNECT_TIMEOUT_MS = 5000;
static constexpr int BLUETOOTH_CONNECT_TIMEOUT_MS = 10000;

// Mirroring service (SPP class UUID)
static constexpr const char* BLUETOOTH_SERVICE_UUID = "00001101-0000-1000-8000-00805F9B34FB";
static constexpr uint8_t BLUETOOTH_SERVICE_UUID_BYTES[16] = {
    0x00, 0x00, 0x11, 0x01, 0x00, 0x00, 0x10, 0x00,
    0x80, 0x00, 0x00, 0x80, 0x5F, 0x9B, 0x34, 0xFB
};

// Frame type tags
static constexpr uint8_t FRAME_TYPE_VIDEO = 0x01;
static constexpr uint8_t FRAME_TYPE_INPUT = 0x02;

static constexpr size_t TYPE_TAG_SIZE = 1;
static constexpr size_t VIDEO_HEADER_SIZE = 16;                 // size + flags + timestamp
static constexpr size_t VIDEO_PREFIX_SIZE = TYPE_TAG_SIZE + VIDEO_HEADER_SIZE;
static constexpr size_t INPUT_FIXED_TAIL_SIZE = 8;              // code + value
static constexpr size_t INPUT_MAX_NAME_LEN = 255;

// AES-256-GCM framing
static constexpr size_t KEY_SIZE = 32;
static constexpr size_t NONCE_SIZE = 12;
static constexpr size_t GCM_TAG_SIZE = 16;

// Upper bound for one frame payload; larger size fields are Malformed
static constexpr uint32_t MAX_FRAME_PAYLOAD = 16u * 1024u * 1024u;

// Largest video plaintext whose sealed form (nonce || ct || tag) fits a frame
static constexpr uint32_t MAX_VIDEO_PLAINTEXT =
    MAX_FRAME_PAYLOAD - static_cast<uint32_t>(NONCE_SIZE + GCM_TAG_SIZE);

// Receive loop read size
static constexpr size_t RECV_CHUNK_SIZE = 64 * 1024;

// =============================================================================
// Big-endian field helpers
// =============================================================================
inline void put_u32_be(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

inline void put_u64_be(uint8_t* p, uint64_t v) {
    put_u32_be(p, static_cast<uint32_t>(v >> 32));
    put_u32_be(p + 4, static_cast<uint32_t>(v));
}

inline uint32_t get_u32_be(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint64_t get_u64_be(const uint8_t* p) {
    return (uint64_t(get_u32_be(p)) << 32) | get_u32_be(p + 4);
}

inline void put_f32_be(uint8_t* p, float v) {
    uint32_t bits;
    memcpy(&bits, &v, sizeof(bits));
    put_u32_be(p, bits);
}

inline float get_f32_be(const uint8_t* p) {
    uint32_t bits = get_u32_be(p);
    float v;
    memcpy(&v, &bits, sizeof(v));
    return v;
}

inline const char* frame_type_name(uint8_t type) {
    switch (type) {
        case FRAME_TYPE_VIDEO: return "VIDEO";
        case FRAME_TYPE_INPUT: return "INPUT";
        default:               return "UNKNOWN";
    }
}

} // namespace castlink::protocol
