// =============================================================================
// CastLink - Frame Codec
// =============================================================================
// Serializes video and input frames onto the shared stream and demultiplexes
// them back out. Decoding is incremental: TCP and RFCOMM give no message
// boundaries, so FrameDecoder buffers until a full header and then a full
// payload are present.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "castlink_protocol.hpp"
#include "input_event.hpp"
#include "result.hpp"

namespace castlink {

enum class FrameType : uint8_t {
    Video = protocol::FRAME_TYPE_VIDEO,
    Input = protocol::FRAME_TYPE_INPUT,
};

struct VideoFrame {
    uint32_t flags = 0;          // opaque, forwarded from the encoder
    int64_t timestamp_us = 0;
    std::vector<uint8_t> payload;
};

struct Frame {
    FrameType type = FrameType::Video;
    VideoFrame video;   // valid when type == Video
    InputEvent input;   // valid when type == Input
};

// Video frame: type tag + 16-byte header + payload. Fails with Malformed if the
// payload exceeds MAX_FRAME_PAYLOAD.
Result<std::vector<uint8_t>> encodeVideoFrame(const uint8_t* payload, size_t len,
                                              uint32_t flags, int64_t timestamp_us);

// Input frame: type tag + name + code + value (<= 18 bytes for known kinds)
std::vector<uint8_t> encodeInputEvent(const InputEvent& event);

class FrameDecoder {
public:
    enum class Status { FrameReady, NeedMoreData, Malformed };

    struct DecodeResult {
        Status status = Status::NeedMoreData;
        Frame frame;          // valid when status == FrameReady
        std::string error;    // valid when status == Malformed
    };

    explicit FrameDecoder(uint32_t max_payload = protocol::MAX_FRAME_PAYLOAD);

    // Append received bytes
    void feed(const uint8_t* data, size_t len);

    // Extract the next frame. On Malformed the offending frame is already
    // dropped, including a rejected video frame's declared payload, so the
    // caller can keep calling.
    DecodeResult decodeNext();

    size_t buffered() const { return buffer_.size() - read_pos_; }
    // Payload bytes of a rejected video frame still to arrive and be discarded
    size_t pendingSkip() const { return skip_remaining_; }
    void reset();

private:
    void consume(size_t n);
    DecodeResult malformed(size_t drop, std::string why);
    DecodeResult rejectVideo(uint32_t size, std::string why);

    uint32_t max_payload_;
    std::vector<uint8_t> buffer_;
    size_t read_pos_ = 0;
    size_t skip_remaining_ = 0;
};

} // namespace castlink
