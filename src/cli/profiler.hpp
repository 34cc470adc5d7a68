#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

// Wall-clock timings of the bootstrap steps (--profile). Each mark() closes
// the phase that started at the previous mark. Written out on destruction.
class Profiler {
public:
    Profiler(bool enabled, std::filesystem::path out_path);
    ~Profiler();

    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    void mark(const std::string& phase);
    bool enabled() const { return enabled_; }

    // "phase seconds" lines plus a total
    std::string report() const;

private:
    using Clock = std::chrono::steady_clock;

    bool enabled_;
    std::filesystem::path out_path_;
    Clock::time_point start_;
    Clock::time_point last_;
    std::vector<std::pair<std::string, double>> phases_;
};
