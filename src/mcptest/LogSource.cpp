//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogSource.cpp
// Purpose: Line sources for the log viewer (docker container, file, stdin)
//==========================================================================================================

#include "mcptest/LogSource.h"
#include "logging/Logger.h"

#include <atomic>
#include <csignal>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include <boost/process.hpp>

namespace bp = boost::process;

namespace mcptest {

namespace {

std::atomic<pid_t> gInterruptTarget{0};
std::atomic<bool> gInterruptColor{true};

// Blocking reads on the docker pipe restart after EINTR, so the handler finishes the process itself.
void onInterrupt(int) {
    const pid_t pid = gInterruptTarget.load();
    if (pid > 0) {
        ::kill(pid, SIGTERM);
    }
    static const char colored[] = "\n\033[90mStopped\033[0m\n";
    static const char plain[] = "\nStopped\n";
    [[maybe_unused]] ssize_t n = gInterruptColor.load() ? ::write(STDOUT_FILENO, colored, sizeof(colored) - 1)
                                                        : ::write(STDOUT_FILENO, plain, sizeof(plain) - 1);
    _exit(0);
}

void stripCarriageReturn(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

class StreamLogSource : public ILogSource {
public:
    StreamLogSource(std::istream& in, std::string sourceName) : in(in), sourceName(std::move(sourceName)) {}

    bool readLine(std::string& line) override {
        if (!std::getline(in, line)) return false;
        stripCarriageReturn(line);
        return true;
    }
    std::string label() const override { return "Source"; }
    std::string name() const override { return sourceName; }

private:
    std::istream& in;
    std::string sourceName;
};

class FileLogSource : public ILogSource {
public:
    explicit FileLogSource(const std::string& path) : path(path), in(path) {
        if (!in.is_open()) {
            throw std::runtime_error("Cannot open log file: " + path);
        }
    }

    bool readLine(std::string& line) override {
        if (!std::getline(in, line)) return false;
        stripCarriageReturn(line);
        return true;
    }
    std::string label() const override { return "File"; }
    std::string name() const override { return path; }

private:
    std::string path;
    std::ifstream in;
};

class DockerLogSource : public ILogSource {
public:
    explicit DockerLogSource(const std::string& container) : container(container) {
        try {
            child = bp::child(bp::search_path("docker"), "logs", "-f", container,
                              (bp::std_out & bp::std_err) > out);
        } catch (const bp::process_error& e) {
            throw std::runtime_error(std::string("Failed to start docker: ") + e.what());
        }
        LOG_DEBUG("DockerLogSource: following {} (pid {})", container, static_cast<long>(child.id()));
    }

    ~DockerLogSource() override {
        std::error_code ec;
        if (child.valid() && child.running(ec)) {
            child.terminate(ec);
        }
        if (child.valid()) {
            child.wait(ec);
        }
    }

    bool readLine(std::string& line) override {
        if (!std::getline(out, line)) return false;
        stripCarriageReturn(line);
        return true;
    }
    std::string label() const override { return "Container"; }
    std::string name() const override { return container; }
    pid_t processId() const override { return child.valid() ? child.id() : 0; }

private:
    std::string container;
    bp::ipstream out;
    bp::child child;
};

} // namespace

std::unique_ptr<ILogSource> MakeStreamLogSource(std::istream& in, std::string name) {
    return std::make_unique<StreamLogSource>(in, std::move(name));
}

std::unique_ptr<ILogSource> MakeFileLogSource(const std::string& path) {
    return std::make_unique<FileLogSource>(path);
}

std::unique_ptr<ILogSource> MakeDockerLogSource(const std::string& container) {
    return std::make_unique<DockerLogSource>(container);
}

std::optional<std::string> DiscoverContainer(const std::string& image) {
    try {
        bp::ipstream out;
        bp::child c(bp::search_path("docker"), "ps", "--filter", "ancestor=" + image, "--format", "{{.Names}}",
                    bp::std_out > out, bp::std_err > bp::null);
        std::optional<std::string> found;
        std::string line;
        while (std::getline(out, line)) {
            stripCarriageReturn(line);
            if (!found.has_value() && !line.empty()) {
                found = line;
            }
        }
        c.wait();
        if (c.exit_code() != 0) {
            LOG_DEBUG("docker ps exited with status {}", c.exit_code());
            return std::nullopt;
        }
        return found;
    } catch (const bp::process_error& e) {
        LOG_DEBUG("Container discovery failed: {}", e.what());
        return std::nullopt;
    }
}

void InstallInterruptHandler(bool color) {
    gInterruptColor = color;
    std::signal(SIGINT, onInterrupt);
}

void SetInterruptTarget(pid_t pid) {
    gInterruptTarget = pid;
}

} // namespace mcptest
