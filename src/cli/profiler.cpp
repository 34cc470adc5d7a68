#include "profiler.hpp"
#include <core/log.hpp>
#include <fstream>
#include <fmt/format.h>

Profiler::Profiler(bool enabled, std::filesystem::path out_path)
    : enabled_(enabled), out_path_(std::move(out_path)),
      start_(Clock::now()), last_(start_) {}

Profiler::~Profiler() {
    if (!enabled_ || phases_.empty()) return;

    std::ofstream out(out_path_, std::ios::trunc);
    if (!out) {
        zt_log(fmt::format("Could not write profile to {}", out_path_.string()));
        return;
    }
    out << report();
}

void Profiler::mark(const std::string& phase) {
    if (!enabled_) return;
    auto now = Clock::now();
    phases_.emplace_back(phase, std::chrono::duration<double>(now - last_).count());
    last_ = now;
}

std::string Profiler::report() const {
    std::string text;
    for (const auto& [phase, secs] : phases_) {
        text += fmt::format("{:<20} {:.6f}\n", phase, secs);
    }
    text += fmt::format("{:<20} {:.6f}\n", "total",
                        std::chrono::duration<double>(last_ - start_).count());
    return text;
}
