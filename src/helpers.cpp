/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "helpers.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <sys/socket.h>
#include <unistd.h>

ssize_t readn(int32_t fd, void *buff, size_t n) {
    size_t left = n;
    char *ptr = static_cast<char *>(buff);
    while (left > 0) {
        ssize_t nread = read(fd, ptr, left);
        if (nread < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        } else if (nread == 0) {
            break;
        }
        left -= nread;
        ptr += nread;
    }
    return n - left;
}

ssize_t writen(int32_t fd, const void *buff, size_t n) {
    size_t left = n;
    const char *ptr = static_cast<const char *>(buff);
    while (left > 0) {
        ssize_t written = send(fd, ptr, left, MSG_NOSIGNAL);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return -1;
        }
        left -= written;
        ptr += written;
    }
    return n;
}

std::string format_address(const sockaddr_in &addr) {
    char ip_buff[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr.sin_addr, ip_buff, sizeof(ip_buff)) == nullptr) {
        return "unknown:" + std::to_string(ntohs(addr.sin_port));
    }
    return std::string(ip_buff) + ":" + std::to_string(ntohs(addr.sin_port));
}
