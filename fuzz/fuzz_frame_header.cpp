// Fuzz target for session frame header parsing
// Tests the 5-byte header (u32 big-endian length + type) read before every frame body

#include "network/wire.hpp"
#include <cstdint>
#include <cstddef>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    using namespace nearlink::wire;

    if (size < FRAME_HEADER_SIZE) {
        return 0;
    }

    auto header = DecodeFrameHeader(data);
    if (!header) {
        return 0;
    }

    // CRITICAL: Accepted body size must be within the frame limit
    if (header->body_size > MAX_FRAME_BODY) {
        __builtin_trap();
    }

    // CRITICAL: Accepted type must be a known frame type
    auto type = static_cast<uint8_t>(header->type);
    if (type < static_cast<uint8_t>(FrameType::INVITE) ||
        type > static_cast<uint8_t>(FrameType::DATA)) {
        __builtin_trap();
    }

    // Re-encoding a small body must decode to the same type
    size_t body_size = size - FRAME_HEADER_SIZE;
    if (body_size <= 4096) {
        std::vector<uint8_t> body(data + FRAME_HEADER_SIZE, data + size);
        auto frame = EncodeFrame(header->type, body);
        auto header2 = DecodeFrameHeader(frame.data());
        if (!header2 || header2->type != header->type || header2->body_size != body.size()) {
            __builtin_trap();
        }
    }

    return 0;
}
