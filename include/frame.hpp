/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "message.hpp"

enum FrameTag : uint8_t {
    FRAME_TAG_UNKNOWN = 0x00,
    FRAME_TAG_STDOUT = 0x0C
};

// length counts the tag byte plus the payload, not itself
struct FrameHeader {
    uint16_t length = 0;
    FrameTag tag = FRAME_TAG_UNKNOWN;
};

struct Frame {
    FrameHeader header;
    std::string payload;
};

// bytes on the wire: length(2) + tag(1), no padding
const size_t kFrameHeaderSize = 3;
const size_t kMaxFramePayloadSize = 0xFFFF - 1;
const size_t kMaxConsoleTextSize = kMaxFramePayloadSize - 6;

// Text that does not fit a 16-bit length is cut at kMaxConsoleTextSize bytes.
void build_stdout_frame(const ConsoleMessage &message, Frame *frame);

void encode_frame(const Frame &frame, std::string *out);

void encode_stdout_frame(const ConsoleMessage &message, std::string *out);
