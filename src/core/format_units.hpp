#pragma once

#include <string>
#include <cstdint>

// Human-readable transfer figures. All thresholds are base-1024.

// "512.00 B/s", "1.50 KB/s", "12.25 MB/s", "1.02 GB/s"
std::string format_speed(double bytes_per_sec);

// "0.00 B", "1.00 KB", ... up to "PB"
std::string format_size(uint64_t bytes);

// Remaining-time display: "45s", "5m 30s", "2h 15m".
// Negative or non-finite input is treated as 0.
std::string format_duration(double seconds);
