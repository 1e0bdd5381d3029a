/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "message.hpp"

#include <arpa/inet.h>
#include <string.h>

#include "log.hpp"

const size_t ConsoleMessage::header_size = sizeof(uint32_t) + sizeof(uint16_t);

const char *message_category_name(MessageCategory category) {
    switch (category) {
        case MESSAGE_CATEGORY_STATUS:
            return "status";
        case MESSAGE_CATEGORY_WARNING:
            return "warning";
        case MESSAGE_CATEGORY_TICK:
            return "tick";
    }
    return "unknown";
}

void ConsoleMessage::serialize(std::string *data) const {
    if (data == nullptr) {
        LERROR(ConsoleMessage) << "Error nullptr";
        return;
    }
    uint32_t elapsed_bits;
    memcpy(&elapsed_bits, &elapsed, sizeof(elapsed_bits));
    elapsed_bits = htonl(elapsed_bits);
    uint16_t sequence_be = htons(sequence);

    data->clear();
    data->reserve(header_size + text.size());
    data->append(reinterpret_cast<const char *>(&elapsed_bits), sizeof(elapsed_bits));
    data->append(reinterpret_cast<const char *>(&sequence_be), sizeof(sequence_be));
    data->append(text);
}

void ConsoleMessage::deserialize(const std::string &data) {
    if (data.size() < header_size) {
        LERROR(ConsoleMessage) << "Payload too short : " << data.size() << " bytes";
        elapsed = 0.0f;
        sequence = 0;
        text.clear();
        return;
    }
    uint32_t elapsed_bits;
    memcpy(&elapsed_bits, data.data(), sizeof(elapsed_bits));
    elapsed_bits = ntohl(elapsed_bits);
    memcpy(&elapsed, &elapsed_bits, sizeof(elapsed));

    uint16_t sequence_be;
    memcpy(&sequence_be, data.data() + sizeof(elapsed_bits), sizeof(sequence_be));
    sequence = ntohs(sequence_be);

    text = data.substr(header_size);
}
