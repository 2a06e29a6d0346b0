// ============= include/core/scoped_timer.hpp =============
#pragma once
#include <chrono>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace facematch {

// Mide una seccion y la loguea al destruirse (nivel debug)
class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : name(std::move(name)), t0(std::chrono::high_resolution_clock::now()) {}

    ~ScopedTimer() {
        spdlog::debug("⏱  {} took {:.2f} ms", name, elapsed_ms());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double elapsed_ms() const {
        auto t1 = std::chrono::high_resolution_clock::now();
        return std::chrono::duration<double, std::milli>(t1 - t0).count();
    }

private:
    std::string name;
    std::chrono::high_resolution_clock::time_point t0;
};

} // namespace facematch
