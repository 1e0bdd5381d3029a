/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#pragma once

#include <stdint.h>

#include <string>

#include "definitions.hpp"
#include "log.hpp"

struct ServerConfig {
    uint32_t rate = RIOCON_DEFAULT_RATE;
    int32_t log_level = LOG_LEVEL_INFO;

    bool validate(std::string *error) const;
};

/**
 * Reads a json object such as {"rate": 20, "log_level": 1} on top of the
 * values already in config. Missing keys are left alone.
 */
bool load_config_file(const std::string &path, ServerConfig *config);

bool parse_config(const std::string &content, ServerConfig *config);

/**
 * riocon_server [rate] [--config file] [--log_level 0..4] [--version]
 *
 * Defaults, then the config file, then command line values. Returns true when
 * the server should start. Otherwise *exit_code is what main should return:
 * 0 for --help and --version, non-zero for bad arguments or a bad config file.
 */
bool parse_command_line(int argc, const char *const *argv, ServerConfig *config, int *exit_code);
