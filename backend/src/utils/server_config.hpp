#pragma once

#include <string>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <algorithm>
#include <optional>

#include "../protocol/message_types.hpp"

namespace netplay {

/**
 * @brief Runtime settings. Precedence: command line > environment > defaults.
 *
 * Environment:
 *   PORT                     listen port (default 3000)
 *   BIND_ADDRESS             listen address (default 0.0.0.0)
 *   THREADS                  io_context worker threads (default: hardware concurrency)
 *   REAPER_INTERVAL_SECONDS  empty-room sweep period (default 60)
 */
struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    unsigned short port = 3000;
    int threads = std::max<int>(1, static_cast<int>(std::thread::hardware_concurrency()));
    std::chrono::seconds reaperInterval{ProtocolConstants::ReaperIntervalSeconds};
    bool showHelp = false;

    /**
     * @brief Build the configuration from argv and the process environment.
     * @throws std::invalid_argument if the port given on the command line is invalid
     */
    static ServerConfig fromArgs(int argc, char* argv[]) {
        ServerConfig cfg;

        if (const char* env = std::getenv("BIND_ADDRESS")) {
            if (*env) cfg.bindAddress = env;
        }
        if (const char* env = std::getenv("PORT")) {
            if (auto port = parsePort(env)) {
                cfg.port = *port;
            } else {
                std::cerr << "Invalid PORT env: " << env << ", using " << cfg.port << std::endl;
            }
        }
        if (const char* env = std::getenv("THREADS")) {
            int value = parsePositive(env);
            if (value > 0) {
                cfg.threads = value;
            } else {
                std::cerr << "Invalid THREADS env: " << env << ", using " << cfg.threads << std::endl;
            }
        }
        if (const char* env = std::getenv("REAPER_INTERVAL_SECONDS")) {
            int value = parsePositive(env);
            if (value > 0) {
                cfg.reaperInterval = std::chrono::seconds(value);
            } else {
                std::cerr << "Invalid REAPER_INTERVAL_SECONDS env: " << env
                          << ", using " << cfg.reaperInterval.count() << std::endl;
            }
        }

        if (argc > 1) {
            std::string arg = argv[1];
            if (arg == "-h" || arg == "--help") {
                cfg.showHelp = true;
                return cfg;
            }
            auto port = parsePort(arg);
            if (!port) {
                throw std::invalid_argument("Invalid port number: " + arg);
            }
            cfg.port = *port;
        }
        return cfg;
    }

    static void printUsage(const char* programName) {
        std::cout << "Usage: " << programName << " [port]" << std::endl;
        std::cout << "  port: Port number to listen on (default: PORT env or 3000)" << std::endl;
        std::cout << "Environment: PORT, BIND_ADDRESS, THREADS, REAPER_INTERVAL_SECONDS" << std::endl;
    }

private:
    static std::optional<unsigned short> parsePort(const std::string& text) {
        int value = parsePositive(text);
        if (value <= 0 || value > 65535) {
            return std::nullopt;
        }
        return static_cast<unsigned short>(value);
    }

    /**
     * @brief Parse a strictly positive decimal integer; returns 0 on any error.
     */
    static int parsePositive(const std::string& text) {
        try {
            size_t consumed = 0;
            long value = std::stol(text, &consumed);
            if (consumed != text.size() || value <= 0 || value > 1000000) {
                return 0;
            }
            return static_cast<int>(value);
        } catch (const std::exception&) {
            return 0;
        }
    }
};

} // namespace netplay
