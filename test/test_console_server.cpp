/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <strings.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "console_server.hpp"

#include "fakes.hpp"
#include "frame_reader.hpp"

namespace {

int32_t connect_to(uint32_t port) {
    int32_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        return -1;
    }
    sockaddr_in addr;
    bzero(&addr, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
        close(fd);
        return -1;
    }
    return fd;
}

ServerConfig config_with_rate(uint32_t rate) {
    ServerConfig config;
    config.rate = rate;
    return config;
}

/**
 * Runs serve_one() a fixed number of times on a worker thread. finish(), also
 * called from the destructor, closes the clients opened through connect(),
 * wakes a worker still blocked in accept and joins it, so a failed assertion
 * never leaves a joinable thread behind.
 */
class ServingThread {
 public:
    ServingThread(ConsoleServer *server, int sessions) : server_(server) {
        worker_ = std::thread([this, sessions]() {
            for (int i = 0; i < sessions; ++i) {
                if (server_->serve_one()) {
                    ++served_ok_;
                }
            }
            done_.store(true);
        });
    }
    ~ServingThread() { finish(); }

    int32_t connect() {
        int32_t fd = connect_to(server_->listening_port());
        if (fd >= 0) {
            clients_.push_back(fd);
        }
        return fd;
    }

    void disconnect(int32_t fd) {
        for (auto ite = clients_.begin(); ite != clients_.end(); ++ite) {
            if (*ite == fd) {
                close(fd);
                clients_.erase(ite);
                return;
            }
        }
    }

    void finish() {
        for (int32_t fd : clients_) {
            close(fd);
        }
        clients_.clear();
        if (!worker_.joinable()) {
            return;
        }
        // closed sessions notice within one frame interval
        for (int i = 0; i < 200 && !done_.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        while (!done_.load()) {
            int32_t fd = connect_to(server_->listening_port());
            if (fd >= 0) {
                close(fd);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        worker_.join();
    }

    int served_ok() const { return served_ok_.load(); }

 private:
    ConsoleServer *server_;
    std::thread worker_;
    std::atomic<bool> done_{false};
    std::atomic<int> served_ok_{0};
    std::vector<int32_t> clients_;
};

}  // namespace

TEST(ConsoleServerTest, FirstFrameOfSession) {
    ConsoleServer server;
    ASSERT_TRUE(server.init("127.0.0.1", 0, config_with_rate(20)));
    ASSERT_NE(server.listening_port(), 0u);
    EXPECT_EQ(server.state(), SERVER_LISTENING);

    DecodedFrame frame;
    {
        ServingThread serving(&server, 1);
        int32_t fd = serving.connect();
        ASSERT_GE(fd, 0);
        ASSERT_TRUE(read_frame(fd, &frame));
        EXPECT_EQ(server.state(), SERVER_SESSION_ACTIVE);
        serving.finish();
        EXPECT_EQ(serving.served_ok(), 1);
    }

    const std::string &text = frame.message.text;
    EXPECT_EQ(frame.length, 1 + 4 + 2 + text.size());
    EXPECT_EQ(frame.tag, 0x0C);
    EXPECT_EQ(frame.message.sequence, 0);
    EXPECT_NEAR(frame.message.elapsed, 0.0, 0.05);
    EXPECT_NE(text.find("[00000]"), std::string::npos) << text;
    EXPECT_NE(text.find("Tick"), std::string::npos) << text;

    EXPECT_EQ(server.state(), SERVER_LISTENING);
    EXPECT_EQ(server.sessions_served(), 1u);
}

TEST(ConsoleServerTest, FramesArriveInSequence) {
    ConsoleServer server;
    ASSERT_TRUE(server.init("127.0.0.1", 0, config_with_rate(200)));
    ServingThread serving(&server, 1);

    int32_t fd = serving.connect();
    ASSERT_GE(fd, 0);
    for (uint16_t expected = 0; expected < 60; ++expected) {
        DecodedFrame frame;
        ASSERT_TRUE(read_frame(fd, &frame)) << "frame " << expected;
        EXPECT_EQ(frame.message.sequence, expected);
        EXPECT_EQ(frame.length, 1 + frame.payload.size());
        EXPECT_EQ(frame.tag, FRAME_TAG_STDOUT);
    }
}

TEST(ConsoleServerTest, ReconnectStartsNewSession) {
    ConsoleServer server;
    ASSERT_TRUE(server.init("127.0.0.1", 0, config_with_rate(50)));
    ServingThread serving(&server, 2);

    int32_t first = serving.connect();
    ASSERT_GE(first, 0);
    DecodedFrame frame;
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(read_frame(first, &frame));
    }
    EXPECT_EQ(frame.message.sequence, 9);
    serving.disconnect(first);

    int32_t second = serving.connect();
    ASSERT_GE(second, 0);
    ASSERT_TRUE(read_frame(second, &frame));
    EXPECT_EQ(frame.message.sequence, 0);
    EXPECT_LT(frame.message.elapsed, 0.1f);
    ASSERT_TRUE(read_frame(second, &frame));
    EXPECT_EQ(frame.message.sequence, 1);

    serving.finish();
    EXPECT_EQ(serving.served_ok(), 2);
    EXPECT_EQ(server.sessions_served(), 2u);
}

TEST(ConsoleServerTest, RateIsRoughlyHonored) {
    const uint32_t rate = 10;
    const float32_t window = 3.0f;
    ConsoleServer server;
    ASSERT_TRUE(server.init("127.0.0.1", 0, config_with_rate(rate)));
    ServingThread serving(&server, 1);

    int32_t fd = serving.connect();
    ASSERT_GE(fd, 0);
    uint32_t frames_in_window = 0;
    while (1) {
        DecodedFrame frame;
        ASSERT_TRUE(read_frame(fd, &frame));
        if (frame.message.elapsed >= window) {
            break;
        }
        ++frames_in_window;
    }

    // no drift correction, so allow 20% either way
    const float64_t expected = rate * window;
    EXPECT_GE(frames_in_window, expected * 0.8);
    EXPECT_LE(frames_in_window, expected * 1.2);
}

TEST(ConsoleServerTest, InjectedClockPacesSession) {
    std::shared_ptr<FakeClock> clock = std::make_shared<FakeClock>();
    ConsoleServer server(clock);
    ASSERT_TRUE(server.init("127.0.0.1", 0, config_with_rate(10)));
    {
        ServingThread serving(&server, 1);
        int32_t fd = serving.connect();
        ASSERT_GE(fd, 0);
        for (int i = 0; i < 20; ++i) {
            DecodedFrame frame;
            ASSERT_TRUE(read_frame(fd, &frame));
            EXPECT_EQ(frame.message.sequence, i);
            EXPECT_NEAR(frame.message.elapsed, 0.1 * i, 1e-4);
        }
    }

    // the worker has been joined, the clock is ours again
    ASSERT_FALSE(clock->sleeps.empty());
    for (float64_t slept : clock->sleeps) {
        EXPECT_DOUBLE_EQ(slept, 0.1);
    }
}

TEST(ConsoleServerTest, BindFailsWhenPortIsTaken) {
    ConsoleServer first;
    ASSERT_TRUE(first.init("127.0.0.1", 0, ServerConfig()));

    ConsoleServer second;
    EXPECT_FALSE(second.init("127.0.0.1", first.listening_port(), ServerConfig()));
    EXPECT_FALSE(second.is_initiated());
    EXPECT_FALSE(second.serve_one());
}

TEST(ConsoleServerTest, InvalidConfigIsRejectedBeforeBinding) {
    ConsoleServer server;
    EXPECT_FALSE(server.init("127.0.0.1", 0, config_with_rate(0)));
    EXPECT_FALSE(server.is_initiated());
}

TEST(ConsoleServerTest, BadAddressIsRejected) {
    ConsoleServer server;
    EXPECT_FALSE(server.init("not an address", 0, ServerConfig()));
    EXPECT_FALSE(server.is_initiated());
}

TEST(ConsoleServerTest, InitOnlyOnce) {
    ConsoleServer server;
    ASSERT_TRUE(server.init("127.0.0.1", 0, ServerConfig()));
    EXPECT_FALSE(server.init("127.0.0.1", 0, ServerConfig()));
    EXPECT_TRUE(server.is_initiated());
}
