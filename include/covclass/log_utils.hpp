#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

#include "covclass/classifier.hpp"

namespace covclass {
namespace log_utils {

// "850 ms", "12.3 s", "4m 05s", "2h 10m 07s"
inline std::string format_duration_ms(int64_t ms) {
    if (ms < 0) ms = 0;
    if (ms < 1000) return std::to_string(ms) + " ms";

    std::ostringstream oss;
    const int64_t total_seconds = ms / 1000;
    if (total_seconds < 60) {
        oss << std::fixed << std::setprecision(1) << (static_cast<double>(ms) / 1000.0) << " s";
        return oss.str();
    }

    const int64_t hours = total_seconds / 3600;
    const int64_t minutes = (total_seconds / 60) % 60;
    const int64_t seconds = total_seconds % 60;
    if (hours > 0) oss << hours << "h " << std::setw(2) << std::setfill('0');
    oss << minutes << "m " << std::setw(2) << std::setfill('0') << seconds << "s";
    return oss.str();
}

template <typename Clock, typename DurA, typename DurB>
inline std::string format_elapsed(
    const std::chrono::time_point<Clock, DurA>& start,
    const std::chrono::time_point<Clock, DurB>& end) {
    const auto ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    return format_duration_ms(ms);
}

// One-line class summary, e.g. "TS=120 TSC=98 TSA=22 TNC=7 TNA=3 NaN=11 | genome in 14 samples"
inline std::string format_class_counts(const ClassCounts& c) {
    std::ostringstream oss;
    oss << "TS=" << c.ts
        << " TSC=" << c.tsc
        << " TSA=" << c.tsa
        << " TNC=" << c.tnc
        << " TNA=" << c.tna
        << " NaN=" << c.undefined
        << " | genome in " << c.genome_positive_samples << " samples";
    return oss.str();
}

}  // namespace log_utils
}  // namespace covclass
