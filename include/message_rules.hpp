/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stdint.h>

#include <functional>
#include <string>
#include <vector>

#include "definitions.hpp"
#include "message.hpp"

struct MessageRule {
    MessageCategory category;
    std::function<bool(uint16_t sequence)> predicate;
    std::function<std::string(uint16_t sequence, float64_t elapsed)> formatter;
};

/**
 * Rules in priority order, first match wins:
 *   sequence % 50 == 0  status line with uptime and rate
 *   sequence % 25 == 0  utilization warning
 *   otherwise           tick line
 * The last rule always matches.
 */
std::vector<MessageRule> default_message_rules(uint32_t rate);

class MessageGenerator {
 public:
    MessageGenerator(uint32_t rate);

    MessageCategory select(uint16_t sequence) const;
    void generate(uint16_t sequence, float64_t elapsed, ConsoleMessage *message) const;

    const std::vector<MessageRule> &rules() const { return rules_; }
    uint32_t rate() const { return rate_; }

 private:
    const MessageRule &match(uint16_t sequence) const;

 private:
    uint32_t rate_;
    std::vector<MessageRule> rules_;
};
