//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RandomData.h
// Purpose: Synthetic technical records returned by the get-random-data tool
//==========================================================================================================

#pragma once

#include <cstdint>
#include <random>
#include <string>

#include <boost/uuid/random_generator.hpp>

#include "mcptest/JSONRPCTypes.h"

namespace mcptest {

//==========================================================================================================
// RandomDataGenerator
// Purpose: Produces random but well-formed records of server metrics. Not thread-safe; the server runs
//          every tool call on a single strand.
// Record shape:
//   request_id (UUID v4), timestamp (ISO-8601 UTC), server_info{hostname, ip_address, mac_address,
//   uptime_seconds}, metrics{cpu_usage_percent, memory_used_mb, memory_total_mb, disk_io_read_mbps,
//   disk_io_write_mbps, network_rx_mbps, network_tx_mbps}, process_info{pid, threads, open_files,
//   connections}, status, tags[], version
//==========================================================================================================
class RandomDataGenerator {
public:
    RandomDataGenerator();
    explicit RandomDataGenerator(std::uint64_t seed);

    JSONValue generateRecord();

    // Simulated latency for include_delay, uniformly 50..500 ms.
    int delayMs();

    std::string randomString(std::size_t length);
    std::string ipAddress();
    std::string macAddress();

private:
    int64_t randInt(int64_t lo, int64_t hi);
    double uniform2dp(double lo, double hi);

    std::mt19937_64 rng;
    boost::uuids::random_generator uuidGen;
};

} // namespace mcptest
