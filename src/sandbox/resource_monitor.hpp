/*
 * resource_monitor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef ASSAY_SANDBOX_RESOURCE_MONITOR_HPP
#define ASSAY_SANDBOX_RESOURCE_MONITOR_HPP

#include <cstddef>
#include <optional>

namespace assay::sandbox {

/**
 * @brief Resource usage of the current process
 */
class ResourceMonitor {
public:
    /**
     * @brief Virtual address space currently mapped
     * @return Size in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getAddressSpaceUsage();

    /**
     * @brief Resident memory of the process
     * @return Memory usage in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getMemoryUsage();

    /**
     * @brief Peak resident memory of the process
     * @return Peak usage in bytes or nullopt if unavailable
     */
    [[nodiscard]] static std::optional<size_t> getPeakMemoryUsage();

    /**
     * @brief User plus system CPU time consumed by the process
     */
    [[nodiscard]] static double getCpuSeconds();
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_RESOURCE_MONITOR_HPP
