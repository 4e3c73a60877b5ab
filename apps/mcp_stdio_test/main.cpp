//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcp-stdio-test entry point: MCP test server on stdin/stdout, diagnostics on stderr
//==========================================================================================================

#include "logging/Logger.h"
#include "mcptest/Config.h"
#include "mcptest/Protocol.h"
#include "mcptest/Server.h"
#include "mcptest/StdioTransport.hpp"
#include "mcptest/Tools.h"
#include "mcptest/version.h"

#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

using namespace mcptest;

namespace {
constexpr const char* CLI_LOGGER_NAME = "mcptest.cli";

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--version] [--help]\n"
              << "\n"
              << "Serves the MCP protocol on stdin/stdout. Diagnostics are written to stderr as JSON lines.\n"
              << "\n"
              << "Environment:\n"
              << "  LOG_LEVEL                DEBUG|INFO|WARNING|ERROR|CRITICAL (default INFO)\n"
              << "  MCPTEST_LOG_FILE         Mirror log lines to this file\n"
              << "  MCPTEST_STDIO_FRAMING    auto|newline|content-length (default auto)\n"
              << "  MCPTEST_MAX_FRAME_BYTES  Maximum inbound frame size (default 1048576)\n";
}
} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << SERVER_NAME << " " << getVersionString() << std::endl;
            return 0;
        }
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        }
        std::cerr << "Unknown option: " << argv[i] << "\n";
        printUsage(argv[0]);
        return 2;
    }

    const ServerConfig config = LoadServerConfigFromEnv();
    Logger::setLogLevel(config.logLevel);
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        LOG_WARN("Could not open log file {}", config.logFile);
    }

    // A vanished client must surface as a write error, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    JSONValue::Object startExtras;
    startExtras["version"] = std::make_shared<JSONValue>(getVersionString());
    Logger::event(LogLevel::LOG_INFO_LEVEL, CLI_LOGGER_NAME, "Starting MCP STDIO Test Server", startExtras);

    int exitCode = 0;
    try {
        net::io_context ioc;

        StdioTransportFactory factory(ioc.get_executor());
        std::unique_ptr<ITransport> transport = factory.CreateTransport(ToTransportConfig(config));

        ToolRegistry registry = MakeDefaultToolRegistry();
        Server server(Implementation{SERVER_NAME, getVersionString()}, registry);

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&transport](const boost::system::error_code& ec, int /*signo*/) {
            if (ec) {
                return;
            }
            Logger::event(LogLevel::LOG_INFO_LEVEL, CLI_LOGGER_NAME, "Received interrupt signal, shutting down...");
            transport->Close();
        });

        net::co_spawn(ioc, server.Run(*transport), [&](std::exception_ptr ep) {
            boost::system::error_code ignored;
            signals.cancel(ignored);
            if (!ep) {
                return;
            }
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                JSONValue::Object extras;
                extras["error"] = std::make_shared<JSONValue>(std::string(e.what()));
                Logger::event(LogLevel::LOG_ERROR_LEVEL, CLI_LOGGER_NAME, "Fatal error in MCP server", extras);
            }
            exitCode = 1;
        });

        ioc.run();
    } catch (const std::exception& e) {
        JSONValue::Object extras;
        extras["error"] = std::make_shared<JSONValue>(std::string(e.what()));
        Logger::event(LogLevel::LOG_ERROR_LEVEL, CLI_LOGGER_NAME, "Fatal error in MCP server", extras);
        exitCode = 1;
    }

    Logger::closeLogFile();
    return exitCode;
}
