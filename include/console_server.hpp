/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <stdint.h>

#include <atomic>
#include <memory>
#include <string>

#include "version.hpp"
#include "definitions.hpp"
#include "clock.hpp"
#include "config.hpp"
#include "message_rules.hpp"

#include "log.hpp"

enum ServerState : uint8_t {
    SERVER_LISTENING = 0,
    SERVER_SESSION_ACTIVE
};

const char *server_state_name(ServerState state);

/**
 * Serves one driver station at a time:
 *   LISTENING -> (accept) -> SESSION_ACTIVE -> (peer gone) -> LISTENING
 * Other peers wait in the listen backlog while a session is active.
 */
class ConsoleServer {
 public:
    ConsoleServer();
    ConsoleServer(std::shared_ptr<Clock> clock);
    ~ConsoleServer();

    // port 0 lets the system choose, see listening_port()
    bool init(const std::string &ip, uint32_t port, const ServerConfig &config);
    bool is_initiated() { return this->initiated_.load(); }

    // serve sessions forever, returns false on a fatal error
    bool run();

    // accept one peer and stream to it until it goes away. true when the
    // server can go back to accepting, false on a fatal error
    bool serve_one();

    ServerState state() const { return this->state_.load(); }
    uint32_t listening_port() const { return listening_port_; }
    uint64_t sessions_served() const { return this->sessions_served_.load(); }

 private:
    std::atomic<bool> initiated_{false};
    std::atomic<ServerState> state_{SERVER_LISTENING};
    std::atomic<uint64_t> sessions_served_{0};

    int32_t listening_sock_ = -1;
    uint32_t listening_port_ = 0;

    ServerConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<MessageGenerator> generator_;

    const std::string api_version_ = RIOCON_VERSION_STRING;

 private:
    void set_state(ServerState state);
    int32_t accept_new_connection(sockaddr_in *peer_addr);
};
