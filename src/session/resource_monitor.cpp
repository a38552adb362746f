#include "resource_monitor.hpp"
#include <ssh/remote_shell.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <regex>
#include <sstream>

namespace {

double percent(double value) {
    value = std::max(0.0, std::min(value, 100.0));
    return std::round(value * 10.0) / 10.0;
}

std::optional<double> to_number(std::string text) {
    std::replace(text.begin(), text.end(), ',', '.');
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used == 0) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// Value in kB of a "Name:   12345 kB" line, if present.
std::optional<double> meminfo_field(const std::string& output, const std::string& name) {
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.compare(0, name.size(), name) != 0) continue;
        std::istringstream fields(line.substr(name.size()));
        std::string value;
        if (fields >> value) return to_number(value);
    }
    return std::nullopt;
}

} // namespace

std::optional<double> parse_cpu_usage(const std::string& output) {
    if (output.find("Cpu(s)") != std::string::npos) {
        // Some locales print "95,2 id"
        static const std::regex idle_re(R"((\d+(?:[.,]\d+)?)\s*%?\s*id)");
        std::smatch m;
        if (!std::regex_search(output, m, idle_re)) return std::nullopt;
        auto idle = to_number(m[1].str());
        if (!idle) return std::nullopt;
        return percent(100.0 - *idle);
    }

    std::istringstream in(output);
    std::string token;
    if (!(in >> token)) return std::nullopt;
    auto total = to_number(token);
    if (!total) return std::nullopt;
    return percent(*total);
}

std::optional<double> parse_memory_usage(const std::string& output) {
    auto mem = output.find("Mem:");
    if (mem != std::string::npos) {
        // "Mem:  total  used  free  shared  buff/cache  available"
        std::istringstream row(output.substr(mem + 4));
        std::string total_s, used_s;
        if (!(row >> total_s >> used_s)) return std::nullopt;
        auto total = to_number(total_s);
        auto used = to_number(used_s);
        if (!total || !used || *total <= 0) return std::nullopt;
        return percent(*used / *total * 100.0);
    }

    auto total = meminfo_field(output, "MemTotal:");
    auto available = meminfo_field(output, "MemAvailable:");
    if (!total || !available || *total <= 0) return std::nullopt;
    return percent((*total - *available) / *total * 100.0);
}

Result<ResourceUsage> sample_resource_usage(RemoteShell& shell, int timeout_ms) {
    using R = Result<ResourceUsage>;

    auto cpu_out = shell.exec(CPU_USAGE_COMMAND, timeout_ms);
    if (cpu_out.is_err()) return R::Err(cpu_out);
    auto mem_out = shell.exec(MEMORY_USAGE_COMMAND, timeout_ms);
    if (mem_out.is_err()) return R::Err(mem_out);

    ResourceUsage usage;
    if (auto cpu = parse_cpu_usage(cpu_out.value)) {
        usage.cpu = *cpu;
    } else {
        log_debug(fmt::format("Unrecognised CPU report: {}", cpu_out.value));
    }
    if (auto memory = parse_memory_usage(mem_out.value)) {
        usage.memory = *memory;
    } else {
        log_debug(fmt::format("Unrecognised memory report: {}", mem_out.value));
    }
    return R::Ok(usage);
}
