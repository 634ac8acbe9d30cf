/*
 * resource_monitor.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "resource_monitor.hpp"

#include <cstdio>
#include <fstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#include <psapi.h>
#else
#include <sys/resource.h>
#include <unistd.h>
#endif

namespace assay::sandbox {

namespace {

#ifndef _WIN32
std::optional<size_t> readStatusKb(const char* key) {
    std::ifstream status("/proc/self/status");
    if (!status) {
        return std::nullopt;
    }
    const std::string prefix = std::string(key) + ":";
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            size_t value;
            if (sscanf(line.c_str() + prefix.size(), " %zu kB", &value) == 1) {
                return value * 1024;  // Convert kB to bytes
            }
        }
    }
    return std::nullopt;
}
#endif

}  // namespace

std::optional<size_t> ResourceMonitor::getAddressSpaceUsage() {
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return pmc.PagefileUsage;
    }
    return std::nullopt;
#else
    std::ifstream statm("/proc/self/statm");
    if (statm) {
        size_t size;
        if (statm >> size) {
            return size * static_cast<size_t>(sysconf(_SC_PAGESIZE));
        }
    }
    return readStatusKb("VmSize");
#endif
}

std::optional<size_t> ResourceMonitor::getMemoryUsage() {
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return pmc.WorkingSetSize;
    }
    return std::nullopt;
#else
    return readStatusKb("VmRSS");
#endif
}

std::optional<size_t> ResourceMonitor::getPeakMemoryUsage() {
#ifdef _WIN32
    PROCESS_MEMORY_COUNTERS pmc;
    if (GetProcessMemoryInfo(GetCurrentProcess(), &pmc, sizeof(pmc))) {
        return pmc.PeakWorkingSetSize;
    }
    return std::nullopt;
#else
    if (auto peak = readStatusKb("VmHWM")) {
        return peak;
    }
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        return static_cast<size_t>(usage.ru_maxrss) * 1024;
    }
    return std::nullopt;
#endif
}

double ResourceMonitor::getCpuSeconds() {
#ifdef _WIN32
    FILETIME creation, exit, kernel, user;
    if (!GetProcessTimes(GetCurrentProcess(), &creation, &exit, &kernel,
                         &user)) {
        return 0.0;
    }
    auto toSeconds = [](const FILETIME& ft) {
        ULARGE_INTEGER value;
        value.LowPart = ft.dwLowDateTime;
        value.HighPart = ft.dwHighDateTime;
        return static_cast<double>(value.QuadPart) / 1e7;
    };
    return toSeconds(kernel) + toSeconds(user);
#else
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0.0;
    }
    return static_cast<double>(usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) +
           static_cast<double>(usage.ru_utime.tv_usec + usage.ru_stime.tv_usec) /
               1e6;
#endif
}

}  // namespace assay::sandbox
