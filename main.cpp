#include "console_server.hpp"

#include "failure_handle.hpp"

int main(int argc, char **argv) {
    InitFailureHandle();
    ServerConfig config;
    int exit_code = 0;
    if (!parse_command_line(argc, argv, &config, &exit_code)) {
        return exit_code;
    }
    g_log_manager.SetLogLevel(config.log_level);

    ConsoleServer server;
    if (!server.init("0.0.0.0", RIOCON_CONSOLE_PORT, config)) {
        LERROR(main) << "Init failed";
        return 1;
    }
    LINFO(main) << "Set team number to 0 in the driver station to connect to localhost";
    if (!server.run()) {
        LERROR(main) << "Server stopped on fatal error";
        return 1;
    }
    return 0;
}
