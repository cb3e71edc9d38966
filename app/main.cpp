#include <csignal>
#include <iostream>
#include <string>

#include "demo-microservice/config.h"
#include "demo-microservice/http.h"
#include "demo-microservice/logger.h"
#include "demo-microservice/result.h"
#include "demo-microservice/service.h"

namespace {

volatile std::sig_atomic_t g_running = 1;
volatile std::sig_atomic_t g_signal_received = 0;

void signal_handler(int signal) {
    g_signal_received = signal;
    g_running = 0;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config_result = demo::ConfigParser::parse(argc, argv);
    if (!config_result) {
        std::cerr << "Error [" << demo::error_code_name(config_result.error().code)
                  << "]: " << config_result.error().message << "\n";
        return static_cast<int>(config_result.error().code);
    }

    auto& config = config_result.value();

    if (config.show_version) {
        std::cout << "demo-microservice " << demo::ConfigParser::version() << "\n";
        return 0;
    }

    if (config.show_help) {
        std::cout << demo::ConfigParser::usage();
        return 0;
    }

    demo::Logger logger;
    logger.set_level(config.log_level);

    logger.info("demo-microservice starting");
    logger.info("version: " + config.service_version + ", profile: " + config.profile);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    demo::DemoService service(config);
    demo::HttpServer server(config.address, config.port, config.workers, &logger);
    service.register_routes(server);

    auto bound = server.bind();
    if (!bound) {
        logger.error(std::string(demo::error_code_name(bound.error().code)) + ": " +
                     bound.error().message);
        return static_cast<int>(bound.error().code);
    }

    logger.info("listening on http://" + server.address() + ":" + std::to_string(server.port()) +
                " with " + std::to_string(config.workers) + " workers");

    auto served = server.serve_forever(&g_running);
    if (!served) {
        logger.error(std::string(demo::error_code_name(served.error().code)) + ": " +
                     served.error().message);
        return static_cast<int>(served.error().code);
    }

    if (g_signal_received != 0) {
        logger.warn("shutdown requested (signal " + std::to_string(g_signal_received) + ")");
    }

    logger.info("demo-microservice stopped");

    return g_signal_received == SIGINT ? 130 : 0;
}
