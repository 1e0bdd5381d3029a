/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "frame.hpp"

#include <arpa/inet.h>

#include "log.hpp"

void build_stdout_frame(const ConsoleMessage &message, Frame *frame) {
    if (frame == nullptr) {
        LERROR(Frame) << "Error nullptr";
        return;
    }
    if (message.text.size() > kMaxConsoleTextSize) {
        LWARN(Frame) << "Console text of " << message.text.size() << " bytes truncated to " << kMaxConsoleTextSize;
        ConsoleMessage truncated = message;
        truncated.text.resize(kMaxConsoleTextSize);
        truncated.serialize(&frame->payload);
    } else {
        message.serialize(&frame->payload);
    }
    frame->header.tag = FRAME_TAG_STDOUT;
    frame->header.length = static_cast<uint16_t>(1 + frame->payload.size());
}

void encode_frame(const Frame &frame, std::string *out) {
    if (out == nullptr) {
        LERROR(Frame) << "Error nullptr";
        return;
    }
    uint16_t length_be = htons(frame.header.length);
    out->clear();
    out->reserve(kFrameHeaderSize + frame.payload.size());
    out->append(reinterpret_cast<const char *>(&length_be), sizeof(length_be));
    out->push_back(static_cast<char>(frame.header.tag));
    out->append(frame.payload);
}

void encode_stdout_frame(const ConsoleMessage &message, std::string *out) {
    Frame frame;
    build_stdout_frame(message, &frame);
    encode_frame(frame, out);
}
