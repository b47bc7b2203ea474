#include "frame_codec.hpp"

#include <cstdio>
#include <cstring>

namespace castlink {

using namespace protocol;

// Keep the tail compaction cheap: only erase once the consumed prefix is large
static constexpr size_t COMPACT_THRESHOLD = 64 * 1024;

Result<std::vector<uint8_t>> encodeVideoFrame(const uint8_t* payload, size_t len,
                                              uint32_t flags, int64_t timestamp_us) {
    if (len > MAX_FRAME_PAYLOAD) {
        return Err<std::vector<uint8_t>>(ErrorKind::Malformed,
            "video payload of " + std::to_string(len) + " bytes exceeds frame bound");
    }

    std::vector<uint8_t> out(VIDEO_PREFIX_SIZE + len);
    uint8_t* p = out.data();
    p[0] = FRAME_TYPE_VIDEO;
    put_u32_be(p + 1, static_cast<uint32_t>(len));
    put_u32_be(p + 5, flags);
    put_u64_be(p + 9, static_cast<uint64_t>(timestamp_us));
    if (len > 0) {
        memcpy(p + VIDEO_PREFIX_SIZE, payload, len);
    }
    return Ok(std::move(out));
}

std::vector<uint8_t> encodeInputEvent(const InputEvent& event) {
    const char* name = inputKindName(event.kind);
    const size_t name_len = strlen(name);

    float value = event.value;
    if (event.kind == InputKind::Touchpad && !event.active) {
        value = TOUCHPAD_RELEASED_VALUE;
    }

    std::vector<uint8_t> out(TYPE_TAG_SIZE + 1 + name_len + INPUT_FIXED_TAIL_SIZE);
    uint8_t* p = out.data();
    p[0] = FRAME_TYPE_INPUT;
    p[1] = static_cast<uint8_t>(name_len);
    memcpy(p + 2, name, name_len);
    p += 2 + name_len;
    put_u32_be(p, static_cast<uint32_t>(event.code));
    put_f32_be(p + 4, value);
    return out;
}

FrameDecoder::FrameDecoder(uint32_t max_payload) : max_payload_(max_payload) {}

void FrameDecoder::feed(const uint8_t* data, size_t len) {
    if (skip_remaining_ > 0) {
        const size_t n = len < skip_remaining_ ? len : skip_remaining_;
        skip_remaining_ -= n;
        data += n;
        len -= n;
    }
    if (len == 0) return;
    buffer_.insert(buffer_.end(), data, data + len);
}

void FrameDecoder::reset() {
    buffer_.clear();
    read_pos_ = 0;
    skip_remaining_ = 0;
}

void FrameDecoder::consume(size_t n) {
    read_pos_ += n;
    if (read_pos_ >= buffer_.size()) {
        buffer_.clear();
        read_pos_ = 0;
    } else if (read_pos_ >= COMPACT_THRESHOLD && read_pos_ * 2 >= buffer_.size()) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + read_pos_);
        read_pos_ = 0;
    }
}

FrameDecoder::DecodeResult FrameDecoder::malformed(size_t drop, std::string why) {
    consume(drop);
    DecodeResult r;
    r.status = Status::Malformed;
    r.error = std::move(why);
    return r;
}

// The size field is trusted for framing even when the frame is rejected, so the
// payload never gets parsed as frames. Whatever has not arrived yet is skipped
// in feed() without being buffered.
FrameDecoder::DecodeResult FrameDecoder::rejectVideo(uint32_t size, std::string why) {
    const size_t have = buffered() - VIDEO_PREFIX_SIZE;
    const size_t taken = have < size ? have : size;
    skip_remaining_ = size - taken;
    return malformed(VIDEO_PREFIX_SIZE + taken, std::move(why));
}

FrameDecoder::DecodeResult FrameDecoder::decodeNext() {
    DecodeResult result;
    const size_t avail = buffered();
    if (avail < TYPE_TAG_SIZE) return result;

    const uint8_t* p = buffer_.data() + read_pos_;

    switch (p[0]) {
    case FRAME_TYPE_VIDEO: {
        if (avail < VIDEO_PREFIX_SIZE) return result;

        const uint32_t size = get_u32_be(p + 1);
        // Checked against the header alone, before any payload is buffered
        if (size > max_payload_) {
            char why[96];
            snprintf(why, sizeof(why), "video size %u exceeds bound %u", size, max_payload_);
            return rejectVideo(size, why);
        }
        if (size < NONCE_SIZE) {
            char why[96];
            snprintf(why, sizeof(why), "video size %u shorter than nonce", size);
            return rejectVideo(size, why);
        }
        if (avail < VIDEO_PREFIX_SIZE + size) return result;

        result.status = Status::FrameReady;
        result.frame.type = FrameType::Video;
        result.frame.video.flags = get_u32_be(p + 5);
        result.frame.video.timestamp_us = static_cast<int64_t>(get_u64_be(p + 9));
        result.frame.video.payload.assign(p + VIDEO_PREFIX_SIZE,
                                          p + VIDEO_PREFIX_SIZE + size);
        consume(VIDEO_PREFIX_SIZE + size);
        return result;
    }

    case FRAME_TYPE_INPUT: {
        if (avail < TYPE_TAG_SIZE + 1) return result;

        const size_t name_len = p[1];
        const size_t total = TYPE_TAG_SIZE + 1 + name_len + INPUT_FIXED_TAIL_SIZE;
        if (avail < total) return result;

        std::string name(reinterpret_cast<const char*>(p + 2), name_len);
        auto kind = parseInputKind(name);
        if (!kind) {
            return malformed(total, "unknown input kind '" + name + "'");
        }

        const uint8_t* tail = p + 2 + name_len;
        result.status = Status::FrameReady;
        result.frame.type = FrameType::Input;
        result.frame.input.kind = *kind;
        result.frame.input.code = static_cast<int32_t>(get_u32_be(tail));
        result.frame.input.value = get_f32_be(tail + 4);
        result.frame.input.active = true;
        if (*kind == InputKind::Touchpad && result.frame.input.value < 0.0f) {
            result.frame.input.active = false;
        }
        consume(total);
        return result;
    }

    default: {
        char why[48];
        snprintf(why, sizeof(why), "unknown frame type 0x%02x", p[0]);
        return malformed(TYPE_TAG_SIZE, why);
    }
    }
}

} // namespace castlink
