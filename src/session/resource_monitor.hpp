#pragma once

#include <optional>
#include <string>
#include <core/types.hpp>

class RemoteShell;

// CPU and memory load of a remote host, in percent with one decimal.
struct ResourceUsage {
    double cpu = 0;
    double memory = 0;
};

// Each command falls back to a second form when the first tool is missing.
constexpr const char* CPU_USAGE_COMMAND =
    "top -bn1 | grep 'Cpu(s)' || ps -eo %cpu | awk '{sum+=$1} END {print sum}'";
constexpr const char* MEMORY_USAGE_COMMAND = "free | grep Mem || cat /proc/meminfo";

// `top` summary line ("%Cpu(s): 3.1 us, ... 95.2 id, ...") as 100 - idle, or
// a bare number (the `ps` sum). Nothing if neither form is recognised.
std::optional<double> parse_cpu_usage(const std::string& output);

// `free` "Mem:" row (used / total) or /proc/meminfo
// ((MemTotal - MemAvailable) / MemTotal).
std::optional<double> parse_memory_usage(const std::string& output);

// Run both commands over `shell`'s connection. Command failures are returned;
// output that cannot be parsed counts as 0.
Result<ResourceUsage> sample_resource_usage(RemoteShell& shell, int timeout_ms);
