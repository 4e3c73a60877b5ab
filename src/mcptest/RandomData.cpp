//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RandomData.cpp
// Purpose: Random record generation for get-random-data
//==========================================================================================================

#include "mcptest/RandomData.h"
#include "logging/Logger.h"

#include <array>
#include <cmath>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <fmt/format.h>

namespace mcptest {

namespace {
constexpr const char* Alphanumeric = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
constexpr std::size_t AlphanumericCount = 62;
constexpr std::array<const char*, 4> Statuses = {"healthy", "degraded", "warning", "critical"};

std::shared_ptr<JSONValue> val(int64_t v) { return std::make_shared<JSONValue>(v); }
std::shared_ptr<JSONValue> val(double v) { return std::make_shared<JSONValue>(v); }
std::shared_ptr<JSONValue> val(const std::string& v) { return std::make_shared<JSONValue>(v); }
} // namespace

RandomDataGenerator::RandomDataGenerator() : rng(std::random_device{}()) {}

RandomDataGenerator::RandomDataGenerator(std::uint64_t seed) : rng(seed) {}

int64_t RandomDataGenerator::randInt(int64_t lo, int64_t hi) {
    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(rng);
}

double RandomDataGenerator::uniform2dp(double lo, double hi) {
    std::uniform_real_distribution<double> dist(lo, hi);
    return std::round(dist(rng) * 100.0) / 100.0;
}

int RandomDataGenerator::delayMs() {
    return static_cast<int>(randInt(50, 500));
}

std::string RandomDataGenerator::randomString(std::size_t length) {
    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(Alphanumeric[randInt(0, AlphanumericCount - 1)]);
    }
    return out;
}

std::string RandomDataGenerator::ipAddress() {
    return fmt::format("{}.{}.{}.{}", randInt(1, 255), randInt(0, 255), randInt(0, 255), randInt(1, 254));
}

std::string RandomDataGenerator::macAddress() {
    std::string out;
    for (int i = 0; i < 6; ++i) {
        if (i > 0) out.push_back(':');
        out += fmt::format("{:02x}", randInt(0, 255));
    }
    return out;
}

JSONValue RandomDataGenerator::generateRecord() {
    JSONValue::Object serverInfo;
    serverInfo["hostname"] = val("server-" + randomString(6));
    serverInfo["ip_address"] = val(ipAddress());
    serverInfo["mac_address"] = val(macAddress());
    serverInfo["uptime_seconds"] = val(randInt(3600, 86400 * 30));

    // memory_used_mb may exceed memory_total_mb; consumers must not rely on the ordering
    JSONValue::Object metrics;
    metrics["cpu_usage_percent"] = val(uniform2dp(5.0, 95.0));
    metrics["memory_used_mb"] = val(randInt(512, 16384));
    metrics["memory_total_mb"] = val(static_cast<int64_t>(32768));
    metrics["disk_io_read_mbps"] = val(uniform2dp(0.1, 500.0));
    metrics["disk_io_write_mbps"] = val(uniform2dp(0.1, 300.0));
    metrics["network_rx_mbps"] = val(uniform2dp(0.01, 1000.0));
    metrics["network_tx_mbps"] = val(uniform2dp(0.01, 500.0));

    JSONValue::Object processInfo;
    processInfo["pid"] = val(randInt(1000, 65535));
    processInfo["threads"] = val(randInt(1, 64));
    processInfo["open_files"] = val(randInt(10, 1000));
    processInfo["connections"] = val(randInt(0, 500));

    JSONValue::Array tags;
    const int64_t tagCount = randInt(2, 5);
    for (int64_t i = 0; i < tagCount; ++i) {
        tags.push_back(val(randomString(4)));
    }

    JSONValue::Object record;
    record["request_id"] = val(boost::uuids::to_string(uuidGen()));
    record["timestamp"] = val(Logger::isoTimestamp());
    record["server_info"] = std::make_shared<JSONValue>(std::move(serverInfo));
    record["metrics"] = std::make_shared<JSONValue>(std::move(metrics));
    record["process_info"] = std::make_shared<JSONValue>(std::move(processInfo));
    record["status"] = val(std::string(Statuses[static_cast<std::size_t>(randInt(0, Statuses.size() - 1))]));
    record["tags"] = std::make_shared<JSONValue>(std::move(tags));
    record["version"] = val(fmt::format("{}.{}.{}", randInt(1, 5), randInt(0, 20), randInt(0, 100)));
    return JSONValue{std::move(record)};
}

} // namespace mcptest
