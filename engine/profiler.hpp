/**
 * @file profiler.hpp
 * @brief Render phase timing and sample statistics
 *
 * Phases (scene setup, pixel loop, output) are recorded explicitly with a
 * Timer; the renderer adds to whatever the caller has already recorded.
 * Fine-grained scopes compile in only when PATHTRACER_ENABLE_PROFILING is
 * defined.
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace pathtracer {

/**
 * @brief Process-wide collector of phase timings and sample counters
 */
class Profiler {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double, std::milli>;

    static Profiler& instance() {
        static Profiler inst;
        return inst;
    }

    /**
     * @brief Drop all timings and counters
     */
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        phases_.clear();
        camera_rays_.store(0, std::memory_order_relaxed);
        skipped_samples_.store(0, std::memory_order_relaxed);
    }

    /**
     * @brief Add time to a named phase (thread-safe)
     */
    void record(const std::string& phase, Duration duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        Phase& p = phases_[phase];
        p.total_ms += duration.count();
        ++p.calls;
    }

    void count_camera_rays(std::uint64_t n) { camera_rays_.fetch_add(n, std::memory_order_relaxed); }

    /**
     * @brief Count a scatter whose combined density was unusable
     */
    void count_skipped_sample() { skipped_samples_.fetch_add(1, std::memory_order_relaxed); }

    std::uint64_t camera_rays() const { return camera_rays_.load(std::memory_order_relaxed); }
    std::uint64_t skipped_samples() const { return skipped_samples_.load(std::memory_order_relaxed); }

    /**
     * @brief Total milliseconds recorded for a phase (0 if never recorded)
     */
    double phase_ms(const std::string& phase) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = phases_.find(phase);
        return it == phases_.end() ? 0.0 : it->second.total_ms;
    }

    /**
     * @brief Print phases, longest first, then sample counters
     */
    void report(std::ostream& out = std::cout) const {
        std::vector<std::pair<std::string, Phase>> sorted;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sorted.assign(phases_.begin(), phases_.end());
        }

        if (sorted.empty()) {
            out << "Profiler: No data collected.\n";
            return;
        }

        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second.total_ms > b.second.total_ms;
        });

        out << "\n===== RENDER PROFILE =====\n";
        out << std::left << std::setw(20) << "Phase"
            << std::right << std::setw(12) << "Total (ms)"
            << std::setw(8) << "Calls" << "\n";
        out << std::string(40, '-') << "\n";

        for (const auto& [name, phase] : sorted) {
            out << std::left << std::setw(20) << name
                << std::right << std::fixed << std::setprecision(1)
                << std::setw(12) << phase.total_ms
                << std::setw(8) << phase.calls << "\n";
        }

        out << std::string(40, '-') << "\n";

        std::uint64_t rays = camera_rays();
        out << "Camera rays:     " << rays << "\n";
        out << "Skipped samples: " << skipped_samples() << "\n";

        double pixel_ms = phase_ms("Pixel Rendering");
        if (pixel_ms > 0.0) {
            double msamples = static_cast<double>(rays) / (pixel_ms * 1e3);
            out << "Throughput:      " << std::setprecision(2) << msamples << " Msamples/s\n";
        }
        out << "==========================\n\n";
    }

private:
    struct Phase {
        double total_ms = 0.0;
        std::uint64_t calls = 0;
    };

    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    mutable std::mutex mutex_;
    std::map<std::string, Phase> phases_;
    std::atomic<std::uint64_t> camera_rays_{0};
    std::atomic<std::uint64_t> skipped_samples_{0};
};

/**
 * @brief Wall-clock stopwatch
 */
class Timer {
public:
    Timer() : start_(Profiler::Clock::now()) {}

    double elapsed_ms() const {
        return Profiler::Duration(Profiler::Clock::now() - start_).count();
    }

    double elapsed_sec() const { return elapsed_ms() / 1000.0; }

private:
    Profiler::Clock::time_point start_;
};

/**
 * @brief Records the lifetime of the scope into a phase
 */
class ProfileScope {
public:
    explicit ProfileScope(std::string phase) : phase_(std::move(phase)) {}
    ~ProfileScope() { Profiler::instance().record(phase_, Profiler::Duration(timer_.elapsed_ms())); }

private:
    std::string phase_;
    Timer timer_;
};

#ifdef PATHTRACER_ENABLE_PROFILING
    #define PATHTRACER_PROFILE_SCOPE(name) pathtracer::ProfileScope _profile_scope_(name)
#else
    #define PATHTRACER_PROFILE_SCOPE(name) ((void)0)
#endif

} // namespace pathtracer
