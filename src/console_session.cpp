/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "console_session.hpp"

#include "frame.hpp"
#include "log.hpp"

ConsoleSession::ConsoleSession(const MessageGenerator &generator, FrameWriter *writer, Clock *clock, uint32_t rate)
    : generator_(generator),
      writer_(writer),
      clock_(clock),
      interval_(1.0 / static_cast<float64_t>(rate)),
      start_time_(clock->now()) {}

WriteStatus ConsoleSession::emit_next() {
    generator_.generate(sequence_, elapsed(), &message_);
    encode_stdout_frame(message_, &buffer_);
    WriteStatus status = writer_->write(buffer_.data(), buffer_.size());
    if (status != WRITE_OK) {
        return status;
    }
    LTRACE(ConsoleSession) << "Sent " << message_category_name(message_.category) << " frame " << sequence_ << ", "
                           << buffer_.size() << " bytes";
    ++frames_sent_;
    ++sequence_;
    return WRITE_OK;
}

SessionEnd ConsoleSession::run() {
    while (1) {
        WriteStatus status = emit_next();
        if (status == WRITE_PEER_CLOSED) {
            return SESSION_PEER_CLOSED;
        } else if (status != WRITE_OK) {
            return SESSION_WRITE_ERROR;
        }
        clock_->sleep(interval_);
    }
}
