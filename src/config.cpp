/**
 * Wang Jiadong <jiadong.wang.94@outlook.com>
 */

#include "config.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "version.hpp"

bool ServerConfig::validate(std::string *error) const {
    std::string reason;
    if (rate == 0) {
        reason = "rate must be a positive integer";
    } else if (log_level < LOG_LEVEL_TRACE || log_level > LOG_LEVEL_ERROR) {
        reason = "log_level must be between 0 and 4";
    }
    if (error != nullptr) {
        *error = reason;
    }
    return reason.empty();
}

bool parse_config(const std::string &content, ServerConfig *config) {
    if (config == nullptr) {
        LERROR(ServerConfig) << "Error nullptr";
        return false;
    }
    ServerConfig parsed = *config;
    try {
        nlohmann::json config_json = nlohmann::json::parse(content);
        if (!config_json.is_object()) {
            LERROR(ServerConfig) << "Config must be a json object";
            return false;
        }
        for (auto &item : config_json.items()) {
            if (item.key() == "rate") {
                if (!item.value().is_number_integer()) {
                    LERROR(ServerConfig) << "Invalid rate " << item.value().dump();
                    return false;
                }
                int64_t rate = item.value().get<int64_t>();
                if (rate <= 0 || rate > UINT32_MAX) {
                    LERROR(ServerConfig) << "Rate out of range " << rate;
                    return false;
                }
                parsed.rate = static_cast<uint32_t>(rate);
            } else if (item.key() == "log_level") {
                if (!item.value().is_number_integer()) {
                    LERROR(ServerConfig) << "Invalid log_level " << item.value().dump();
                    return false;
                }
                int64_t log_level = item.value().get<int64_t>();
                if (log_level < LOG_LEVEL_TRACE || log_level > LOG_LEVEL_ERROR) {
                    LERROR(ServerConfig) << "Log level out of range " << log_level;
                    return false;
                }
                parsed.log_level = static_cast<int32_t>(log_level);
            } else {
                LWARN(ServerConfig) << "Ignoring unknown config key " << item.key();
            }
        }
    } catch (nlohmann::json::exception &e) {
        LERROR(ServerConfig) << "Exception in json : " << e.what();
        return false;
    }
    std::string error;
    if (!parsed.validate(&error)) {
        LERROR(ServerConfig) << "Invalid config : " << error;
        return false;
    }
    *config = parsed;
    return true;
}

bool load_config_file(const std::string &path, ServerConfig *config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LERROR(ServerConfig) << "Failed to open config file " << path;
        return false;
    }
    std::stringstream content;
    content << file.rdbuf();
    LDEBUG(ServerConfig) << "Content : " << content.str();
    return parse_config(content.str(), config);
}

bool parse_command_line(int argc, const char *const *argv, ServerConfig *config, int *exit_code) {
    if (config == nullptr || exit_code == nullptr) {
        LERROR(ServerConfig) << "Error nullptr";
        return false;
    }
    *exit_code = 0;
    CLI::App app{"riocon_server: fake robot controller console on tcp port " STRING(RIOCON_CONSOLE_PORT)};
    uint32_t rate = RIOCON_DEFAULT_RATE;
    CLI::Option *rate_option =
        app.add_option("rate", rate, "messages per second, default: 10")->check(CLI::PositiveNumber);
    std::string config_path;
    app.add_option("--config", config_path, "json config file, command line values take precedence")
        ->check(CLI::ExistingFile);
    int32_t log_level = LOG_LEVEL_INFO;
    CLI::Option *log_level_option =
        app.add_option("--log_level", log_level, "0 trace, 1 debug, 2 info, 3 warn, 4 error, default: 2")
            ->check(CLI::Range(0, 4));
    bool show_version = false;
    app.add_flag("--version", show_version, "print version and exit");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        *exit_code = app.exit(e);
        return false;
    }

    if (show_version) {
        std::cout << "riocon_server " << RIOCON_VERSION_STRING << std::endl;
        return false;
    }

    ServerConfig parsed = *config;
    if (!config_path.empty() && !load_config_file(config_path, &parsed)) {
        LERROR(ServerConfig) << "Failed to load config " << config_path;
        *exit_code = 1;
        return false;
    }
    if (rate_option->count() > 0) {
        parsed.rate = rate;
    }
    if (log_level_option->count() > 0) {
        parsed.log_level = log_level;
    }
    std::string error;
    if (!parsed.validate(&error)) {
        LERROR(ServerConfig) << "Invalid config : " << error;
        *exit_code = 1;
        return false;
    }
    *config = parsed;
    return true;
}
