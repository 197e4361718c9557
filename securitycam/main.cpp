#include "security_cam.h"
#include "config.h"
#include "logger.h"
#include <iostream>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <curl/curl.h>

std::atomic<bool> shutdown_requested(false);

void signalHandler(int) {
    shutdown_requested = true;
}

int main(int argc, char** argv) {
    std::string config_path = "/etc/securitycam/config.json";
    if (argc > 1) {
        config_path = argv[1];
    }

    const char* env_file = std::getenv("ENV_FILE");
    std::string env_path = env_file ? env_file : ".env";

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    CamConfig config;
    try {
        config = CamConfig::load(config_path, env_path);
    } catch (const ConfigError& e) {
        std::cerr << "[FATAL] Configuration error: " << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    Logger::instance().init(config.log_dir);
    logInfo("Main", "SecurityCam starting");
    logDebug("Main", "Configuration: " + config.toJson().dump());

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        logError("Main", "Failed to initialize libcurl");
        return 1;
    }

    int exit_code = 0;
    try {
        SecurityCam cam(config);
        cam.start();

        while (!shutdown_requested && cam.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        logInfo("Main", "Stopping...");
        cam.stop();
        logInfo("Main", "SecurityCam stopped");

    } catch (const std::exception& e) {
        logError("Main", std::string("[FATAL] ") + e.what());
        exit_code = 1;
    }

    curl_global_cleanup();
    Logger::instance().shutdown();
    return exit_code;
}
