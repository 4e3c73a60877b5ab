//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Implements version helpers returning semantic version string.
//==========================================================================================================
#include "mcptest/version.h"

#include <fmt/format.h>

namespace mcptest {

VersionInfo getVersion() {
    return VersionInfo{MCPTEST_VERSION_MAJOR, MCPTEST_VERSION_MINOR, MCPTEST_VERSION_PATCH};
}

std::string getVersionString() {
    const auto v = getVersion();
    return fmt::format("{}.{}.{}", v.major, v.minor, v.patch);
}

} // namespace mcptest
