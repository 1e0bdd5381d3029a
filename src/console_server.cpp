/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "console_server.hpp"

#include <errno.h>
#include <string.h>
#include <strings.h>
#include <unistd.h>

#include "helpers.hpp"
#include "frame_writer.hpp"
#include "console_session.hpp"

const char *server_state_name(ServerState state) {
    switch (state) {
        case SERVER_LISTENING:
            return "LISTENING";
        case SERVER_SESSION_ACTIVE:
            return "SESSION_ACTIVE";
    }
    return "UNKNOWN";
}

ConsoleServer::ConsoleServer() : clock_(std::make_shared<SteadyClock>()) {}

ConsoleServer::ConsoleServer(std::shared_ptr<Clock> clock) : clock_(clock) {}

ConsoleServer::~ConsoleServer() {
    if (listening_sock_ >= 0) {
        close(listening_sock_);
    }
}

bool ConsoleServer::init(const std::string &ip, uint32_t port, const ServerConfig &config) {
    if (this->initiated_.load()) {
        LWARN(ConsoleServer) << "Already initiated";
        return false;
    }
    if (clock_ == nullptr) {
        LERROR(ConsoleServer) << "Error nullptr clock";
        return false;
    }
    std::string error;
    if (!config.validate(&error)) {
        LERROR(ConsoleServer) << "Invalid config : " << error;
        return false;
    }

    if ((listening_sock_ = socket(AF_INET, SOCK_STREAM, 0)) < 0) {
        LERROR(ConsoleServer) << "Failed to create socket : " << strerror(errno);
        listening_sock_ = -1;
        return false;
    }
    int32_t reuse = 1;
    if (setsockopt(listening_sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        LWARN(ConsoleServer) << "Failed to set SO_REUSEADDR : " << strerror(errno);
    }

    sockaddr_in listening_addr;
    bzero(&listening_addr, sizeof(listening_addr));
    listening_addr.sin_family = AF_INET;
    listening_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &listening_addr.sin_addr) <= 0) {
        LERROR(ConsoleServer) << "Failed to convert ip address " << ip;
        close(listening_sock_);
        listening_sock_ = -1;
        return false;
    }
    if (bind(listening_sock_, reinterpret_cast<sockaddr *>(&listening_addr), sizeof(listening_addr)) < 0) {
        LERROR(ConsoleServer) << "Failed to bind to ip " << ip << " port " << port << " : " << strerror(errno);
        close(listening_sock_);
        listening_sock_ = -1;
        return false;
    }
    if (listen(listening_sock_, RIOCON_LISTEN_BACKLOG) < 0) {
        LERROR(ConsoleServer) << "Failed to start listening : " << strerror(errno);
        close(listening_sock_);
        listening_sock_ = -1;
        return false;
    }

    sockaddr_in socket_addr;
    bzero(&socket_addr, sizeof(socket_addr));
    socklen_t addr_size = sizeof(socket_addr);
    if (getsockname(listening_sock_, reinterpret_cast<sockaddr *>(&socket_addr), &addr_size) < 0) {
        LERROR(ConsoleServer) << "Failed to getsockname : " << strerror(errno);
        close(listening_sock_);
        listening_sock_ = -1;
        return false;
    }
    listening_port_ = ntohs(socket_addr.sin_port);

    config_ = config;
    generator_ = std::make_shared<MessageGenerator>(config_.rate);
    state_.store(SERVER_LISTENING);
    LINFO(ConsoleServer) << "riocon " << api_version_ << " listening on " << format_address(socket_addr) << ", "
                         << config_.rate << " msgs/sec";
    this->initiated_.store(true);
    return true;
}

void ConsoleServer::set_state(ServerState state) {
    ServerState previous = state_.exchange(state);
    if (previous != state) {
        LDEBUG(ConsoleServer) << server_state_name(previous) << " -> " << server_state_name(state);
    }
}

int32_t ConsoleServer::accept_new_connection(sockaddr_in *peer_addr) {
    while (1) {
        bzero(peer_addr, sizeof(*peer_addr));
        socklen_t ret_size = sizeof(*peer_addr);
        int32_t fd = accept(listening_sock_, reinterpret_cast<sockaddr *>(peer_addr), &ret_size);
        if (fd >= 0) {
            if (ret_size > sizeof(*peer_addr)) {
                LWARN(ConsoleServer) << "Unexpected ret_size of accept()";
            }
            return fd;
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        LERROR(ConsoleServer) << "Failed to accept : " << strerror(errno);
        return -1;
    }
}

bool ConsoleServer::serve_one() {
    if (!this->initiated_.load()) {
        LERROR(ConsoleServer) << "Not initiated";
        return false;
    }
    set_state(SERVER_LISTENING);

    sockaddr_in peer_addr;
    int32_t fd = accept_new_connection(&peer_addr);
    if (fd < 0) {
        return false;
    }
    std::string peer = format_address(peer_addr);
    LINFO(ConsoleServer) << "DS connected from " << peer;
    set_state(SERVER_SESSION_ACTIVE);

    SocketFrameWriter writer(fd);
    ConsoleSession session(*generator_, &writer, clock_.get(), config_.rate);
    SessionEnd end = session.run();
    close(fd);
    ++sessions_served_;
    set_state(SERVER_LISTENING);

    if (end == SESSION_PEER_CLOSED) {
        LINFO(ConsoleServer) << "DS " << peer << " disconnected after " << session.frames_sent()
                             << " frames, waiting for reconnect...";
        return true;
    }
    LERROR(ConsoleServer) << "Session with " << peer << " failed after " << session.frames_sent() << " frames";
    return false;
}

bool ConsoleServer::run() {
    while (serve_one()) {
    }
    return false;
}
