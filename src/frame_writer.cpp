/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "frame_writer.hpp"

#include <errno.h>
#include <string.h>

#include "helpers.hpp"
#include "log.hpp"

const char *write_status_name(WriteStatus status) {
    switch (status) {
        case WRITE_OK:
            return "ok";
        case WRITE_PEER_CLOSED:
            return "peer closed";
        case WRITE_ERROR:
            return "error";
    }
    return "unknown";
}

WriteStatus SocketFrameWriter::write(const void *data, size_t length) {
    if (writen(fd_, data, length) >= 0) {
        return WRITE_OK;
    }
    int err = errno;
    if (err == EPIPE || err == ECONNRESET) {
        LDEBUG(SocketFrameWriter) << "Peer closed socket " << fd_ << " : " << strerror(err);
        return WRITE_PEER_CLOSED;
    }
    LERROR(SocketFrameWriter) << "Failed to write to socket " << fd_ << " : " << strerror(err);
    return WRITE_ERROR;
}
