/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stdint.h>

#include <string>

#include "clock.hpp"
#include "frame_writer.hpp"
#include "message_rules.hpp"

enum SessionEnd {
    SESSION_PEER_CLOSED = 0,
    SESSION_WRITE_ERROR
};

/**
 * Emission loop for one accepted connection. Sequence and start time belong to
 * the session, a new session always starts again at sequence 0.
 */
class ConsoleSession {
 public:
    ConsoleSession(const MessageGenerator &generator, FrameWriter *writer, Clock *clock, uint32_t rate);

    // build, encode and write one frame, then advance the sequence
    WriteStatus emit_next();

    // emit_next() then sleep 1 / rate, until a write fails
    SessionEnd run();

    uint16_t sequence() const { return sequence_; }
    uint64_t frames_sent() const { return frames_sent_; }
    float64_t elapsed() const { return clock_->now() - start_time_; }

 private:
    const MessageGenerator &generator_;
    FrameWriter *writer_;
    Clock *clock_;
    float64_t interval_;
    float64_t start_time_;
    uint16_t sequence_ = 0;
    uint64_t frames_sent_ = 0;
    ConsoleMessage message_;
    std::string buffer_;
};
