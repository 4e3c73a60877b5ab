//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcp-stdio-view-logs entry point: follows the server's log stream and prints a call table
//==========================================================================================================

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcptest/LogCorrelator.h"
#include "mcptest/LogSource.h"

#include <cstring>
#include <iostream>
#include <optional>
#include <string>

using namespace mcptest;

namespace {

struct ViewerOptions {
    std::optional<std::string> container;
    std::optional<std::string> file;
    bool useStdin{false};
    bool color{true};
};

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [container] [--stdin] [--file PATH] [--no-color]\n";
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnv();
    Logger::setDefaultLoggerName("mcptest.viewer");

    ViewerOptions opts;
    opts.color = !IsEnvSet("NO_COLOR");
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--no-color") == 0) {
            opts.color = false;
        } else if (std::strcmp(arg, "--stdin") == 0) {
            opts.useStdin = true;
        } else if (std::strcmp(arg, "--file") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "--file requires a path\n";
                printUsage(argv[0]);
                return 2;
            }
            opts.file = argv[++i];
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else if (!opts.container.has_value()) {
            opts.container = arg;
        }
    }
    // Before discovery: the docker calls below can block
    InstallInterruptHandler(opts.color);
    const Palette palette = opts.color ? Palette::ansi() : Palette::plain();

    std::unique_ptr<ILogSource> source;
    try {
        if (opts.useStdin) {
            source = MakeStreamLogSource(std::cin, "stdin");
        } else if (opts.file.has_value()) {
            source = MakeFileLogSource(opts.file.value());
        } else {
            if (!opts.container.has_value()) {
                opts.container = DiscoverContainer();
            }
            if (!opts.container.has_value()) {
                std::cout << palette.red << "No container found. Usage: " << argv[0] << " [container_name]"
                          << palette.reset << std::endl;
                return 1;
            }
            source = MakeDockerLogSource(opts.container.value());
        }
    } catch (const std::runtime_error& e) {
        std::cout << palette.red << e.what() << palette.reset << std::endl;
        return 1;
    }

    SetInterruptTarget(source->processId());

    LogViewer viewer(std::cout, source->label(), source->name(), opts.color);
    viewer.printHeader();

    std::string line;
    while (source->readLine(line)) {
        viewer.processLine(line);
    }
    LOG_DEBUG("Log source {} ended after {} rendered lines", source->name(), viewer.renderedLines());
    return 0;
}
