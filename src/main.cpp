#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>

#include "app/Commands.hpp"
#include "common/Config.hpp"
#include "logging/Log.h"

namespace {

constexpr logging::LogCategory kLogCategory = logging::LogCategory::JOBS;

std::atomic<int> gSignalCount{0};

void handleSignal(int /*signal*/) {
    gSignalCount.fetch_add(1);
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    mdi::common::Config config;
    try {
        config = mdi::common::Config::fromArgs(argc, argv);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "%s\n\n%s", ex.what(), mdi::common::Config::usage().c_str());
        return app::kExitUsage;
    }
    logging::Log::set_log_level(config.logLevel);

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    int code = app::kExitFailed;
    try {
        LOG_INFO(kLogCategory,
                 "mdi %s provider=%s duckdb=%s log_level=%s",
                 mdi::common::to_string(config.command),
                 config.provider.c_str(),
                 config.duckdbPath.c_str(),
                 logging::Log::level_to_string(config.logLevel));
        code = app::dispatch(config, gSignalCount);
    } catch (const std::exception& ex) {
        LOG_ERROR(kLogCategory, "Fatal: %s", ex.what());
        code = app::kExitFailed;
    }

    logging::Log::flush();
    return code;
}
