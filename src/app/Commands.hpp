#pragma once

#include <atomic>

#include "common/Config.hpp"

namespace app {

inline constexpr int kExitOk = 0;
inline constexpr int kExitFailed = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitForced = 3;

// Entry points of the CLI commands. `signals` counts SIGINT/SIGTERM deliveries; the
// first asks for a graceful stop, the second forces one.
int runMigrate(const mdi::common::Config& config);
int runBackfill(const mdi::common::Config& config, const std::atomic<int>& signals);
int runResume(const mdi::common::Config& config, const std::atomic<int>& signals);
int runRealtime(const mdi::common::Config& config, const std::atomic<int>& signals);

int dispatch(const mdi::common::Config& config, const std::atomic<int>& signals);

}  // namespace app
