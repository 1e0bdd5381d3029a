/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stdint.h>

typedef float float32_t;
typedef double float64_t;

// the driver station only looks for the console on this port
#define RIOCON_CONSOLE_PORT 1740
#define RIOCON_DEFAULT_RATE 10
#define RIOCON_LISTEN_BACKLOG 1
