//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogSource.h
// Purpose: Line sources for the log viewer (docker container, file, stdin)
//==========================================================================================================

#pragma once

#include <istream>
#include <memory>
#include <optional>
#include <string>

#include <sys/types.h>

namespace mcptest {

// Image the container discovery filters on.
inline constexpr const char* DEFAULT_CONTAINER_IMAGE = "mcp-stdio-docker-test";

//==========================================================================================================
// ILogSource
// Purpose: Blocking, line-oriented reader over a log stream.
//==========================================================================================================
class ILogSource {
public:
    virtual ~ILogSource() = default;

    // Reads the next line (without terminator). Returns false at end of stream.
    virtual bool readLine(std::string& line) = 0;

    // Header label and value, e.g. {"Container", "mcp-1"}.
    virtual std::string label() const = 0;
    virtual std::string name() const = 0;

    // Child process backing the source, 0 when there is none.
    virtual pid_t processId() const { return 0; }
};

// Reads from an existing stream (std::cin for --stdin). The stream must outlive the source.
std::unique_ptr<ILogSource> MakeStreamLogSource(std::istream& in, std::string name);

// Reads a file; throws std::runtime_error when it cannot be opened.
std::unique_ptr<ILogSource> MakeFileLogSource(const std::string& path);

// Follows `docker logs -f <container>` with stdout and stderr merged.
// Throws std::runtime_error when docker cannot be started.
std::unique_ptr<ILogSource> MakeDockerLogSource(const std::string& container);

//==========================================================================================================
// Finds a running container created from the given image.
// Returns:
//   The first name reported by `docker ps`, or std::nullopt when none runs or docker is unavailable.
//==========================================================================================================
std::optional<std::string> DiscoverContainer(const std::string& image = DEFAULT_CONTAINER_IMAGE);

//==========================================================================================================
// InstallInterruptHandler
// Purpose: SIGINT prints "Stopped" (gray when color is on) to stdout, sends SIGTERM to the registered
//          child process if any, and exits with status 0. Install before any blocking docker call.
//==========================================================================================================
void InstallInterruptHandler(bool color);

// Child process signalled by the interrupt handler; 0 clears it.
void SetInterruptTarget(pid_t pid);

} // namespace mcptest
