/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

enum WriteStatus {
    WRITE_OK = 0,
    WRITE_PEER_CLOSED,
    WRITE_ERROR
};

const char *write_status_name(WriteStatus status);

class FrameWriter {
 public:
    virtual ~FrameWriter() {}
    // blocks until every byte is written or the write fails
    virtual WriteStatus write(const void *data, size_t length) = 0;
};

/**
 * Writes to a connected socket it does not own.
 * EPIPE and ECONNRESET mean the peer went away, anything else is WRITE_ERROR.
 */
class SocketFrameWriter : public FrameWriter {
 public:
    SocketFrameWriter(int32_t fd) : fd_(fd) {}
    virtual WriteStatus write(const void *data, size_t length) override;

 private:
    int32_t fd_;
};
