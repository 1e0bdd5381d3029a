/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <netinet/in.h>
#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>

#include <string>

// Read exactly n bytes unless the peer closes first. Returns the number of
// bytes read, or -1 on error with errno set.
ssize_t readn(int32_t fd, void *buff, size_t n);

// Write all n bytes. Returns n, or -1 on error with errno set. Never raises
// SIGPIPE.
ssize_t writen(int32_t fd, const void *buff, size_t n);

// "ip:port"
std::string format_address(const sockaddr_in &addr);
