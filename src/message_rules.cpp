/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "message_rules.hpp"

#include <stdio.h>

#include "log.hpp"

std::vector<MessageRule> default_message_rules(uint32_t rate) {
    std::vector<MessageRule> rules;

    MessageRule status;
    status.category = MESSAGE_CATEGORY_STATUS;
    status.predicate = [](uint16_t sequence) { return sequence % 50 == 0; };
    status.formatter = [rate](uint16_t sequence, float64_t elapsed) {
        char buff[128];
        snprintf(buff, sizeof(buff), "[%05u] Tick %.2fs === PERIODIC STATUS: uptime=%.1fs rate=%u/s ===",
                 static_cast<unsigned>(sequence), elapsed, elapsed, static_cast<unsigned>(rate));
        return std::string(buff);
    };
    rules.push_back(status);

    MessageRule warning;
    warning.category = MESSAGE_CATEGORY_WARNING;
    warning.predicate = [](uint16_t sequence) { return sequence % 25 == 0; };
    warning.formatter = [](uint16_t sequence, float64_t) {
        char buff[128];
        snprintf(buff, sizeof(buff), "[%05u] WARNING: CAN utilization at 78%% - check wiring",
                 static_cast<unsigned>(sequence));
        return std::string(buff);
    };
    rules.push_back(warning);

    MessageRule tick;
    tick.category = MESSAGE_CATEGORY_TICK;
    tick.predicate = [](uint16_t) { return true; };
    tick.formatter = [](uint16_t sequence, float64_t elapsed) {
        char buff[128];
        snprintf(buff, sizeof(buff), "[%05u] Tick %.2fs - The quick brown fox jumps over the lazy dog",
                 static_cast<unsigned>(sequence), elapsed);
        return std::string(buff);
    };
    rules.push_back(tick);

    return rules;
}

MessageGenerator::MessageGenerator(uint32_t rate) : rate_(rate), rules_(default_message_rules(rate)) {}

const MessageRule &MessageGenerator::match(uint16_t sequence) const {
    for (const auto &rule : rules_) {
        if (rule.predicate(sequence)) {
            return rule;
        }
    }
    return rules_.back();
}

MessageCategory MessageGenerator::select(uint16_t sequence) const { return match(sequence).category; }

void MessageGenerator::generate(uint16_t sequence, float64_t elapsed, ConsoleMessage *message) const {
    if (message == nullptr) {
        LERROR(MessageGenerator) << "Error nullptr";
        return;
    }
    const MessageRule &rule = match(sequence);
    message->sequence = sequence;
    message->elapsed = static_cast<float32_t>(elapsed);
    message->category = rule.category;
    message->text = rule.formatter(sequence, elapsed);
}
