/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <string>
#include <stdlib.h>

#include "definitions.hpp"

class MessageBase {
 public:
    virtual ~MessageBase() {}
    virtual void serialize(std::string *data) const = 0;
    virtual void deserialize(const std::string &data) = 0;
};

enum MessageCategory : uint8_t {
    MESSAGE_CATEGORY_STATUS = 0,
    MESSAGE_CATEGORY_WARNING,
    MESSAGE_CATEGORY_TICK
};

const char *message_category_name(MessageCategory category);

/**
 * One console line as printed by the robot program.
 *
 * Payload layout, all big-endian:
 *   elapsed  float32  seconds since the session started
 *   sequence uint16   wraps at 65536
 *   text     bytes    utf-8, no terminator
 */
class ConsoleMessage : public MessageBase {
 public:
    static const size_t header_size;

 public:
    virtual void serialize(std::string *data) const override;
    virtual void deserialize(const std::string &data) override;

 public:
    float32_t elapsed = 0.0f;
    uint16_t sequence = 0;
    std::string text;
    // not on the wire
    MessageCategory category = MESSAGE_CATEGORY_TICK;
};
