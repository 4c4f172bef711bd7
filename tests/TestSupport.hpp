#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#define CHECK(cond)                                                                                     \
    do {                                                                                                \
        if (!(cond)) {                                                                                  \
            std::cerr << __FILE__ << ':' << __LINE__ << ": check failed: " << #cond << "\n";           \
            return 1;                                                                                   \
        }                                                                                               \
    } while (false)

#define CHECK_MSG(cond, msg)                                                                            \
    do {                                                                                                \
        if (!(cond)) {                                                                                  \
            std::cerr << __FILE__ << ':' << __LINE__ << ": " << msg << "\n";                          \
            return 1;                                                                                   \
        }                                                                                               \
    } while (false)

#define RUN(scenario)                                                                                   \
    do {                                                                                                \
        if ((scenario)() != 0) {                                                                        \
            std::cerr << "FAILED " << #scenario << "\n";                                                \
            return 1;                                                                                   \
        }                                                                                               \
    } while (false)

namespace testing_support {

inline bool waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

}  // namespace testing_support
