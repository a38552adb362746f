#include "format_units.hpp"
#include <fmt/format.h>
#include <cmath>

std::string format_speed(double speed) {
    if (speed >= 1024.0 * 1024.0 * 1024.0) {
        return fmt::format("{:.2f} GB/s", speed / (1024.0 * 1024.0 * 1024.0));
    } else if (speed >= 1024.0 * 1024.0) {
        return fmt::format("{:.2f} MB/s", speed / (1024.0 * 1024.0));
    } else if (speed >= 1024.0) {
        return fmt::format("{:.2f} KB/s", speed / 1024.0);
    }
    return fmt::format("{:.2f} B/s", speed);
}

std::string format_size(uint64_t bytes) {
    static const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    for (const char* unit : UNITS) {
        if (size < 1024.0) {
            return fmt::format("{:.2f} {}", size, unit);
        }
        size /= 1024.0;
    }
    return fmt::format("{:.2f} PB", size);
}

std::string format_duration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) seconds = 0;

    if (seconds < 60) {
        return fmt::format("{:.0f}s", seconds);
    }

    auto total = static_cast<uint64_t>(seconds);
    uint64_t hours = total / 3600;
    uint64_t mins = (total % 3600) / 60;
    uint64_t secs = total % 60;

    if (hours > 0) {
        return fmt::format("{}h {}m", hours, mins);
    }
    return fmt::format("{}m {}s", mins, secs);
}
