/*
 * lazy_resource.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file lazy_resource.hpp
 * @brief A value built on first use that can be dropped and rebuilt
 */

#ifndef ASSAY_SANDBOX_LAZY_RESOURCE_HPP
#define ASSAY_SANDBOX_LAZY_RESOURCE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "atom/type/noncopyable.hpp"

namespace assay::sandbox {

/**
 * @brief Lazily constructed, resettable resource
 *
 * get() builds the value with the factory the first time it is asked
 * for, and again after invalidate(). generation() counts builds, so a
 * caller can tell whether it is looking at a rebuilt value.
 */
template <typename T>
class LazyResource : public NonCopyable {
public:
    using Factory = std::function<std::unique_ptr<T>()>;

    explicit LazyResource(Factory factory) : factory_(std::move(factory)) {}

    /**
     * @brief The value, building it if needed
     *
     * A factory that throws leaves the resource empty; the next call
     * tries again.
     */
    auto get() -> T& {
        std::lock_guard lock(mutex_);
        if (!value_) {
            value_ = factory_();
            ++generation_;
        }
        return *value_;
    }

    /**
     * @brief Drop the value; the next get() rebuilds it
     */
    void invalidate() {
        std::lock_guard lock(mutex_);
        value_.reset();
    }

    [[nodiscard]] auto ready() const -> bool {
        std::lock_guard lock(mutex_);
        return value_ != nullptr;
    }

    [[nodiscard]] auto generation() const -> std::uint64_t {
        std::lock_guard lock(mutex_);
        return generation_;
    }

private:
    mutable std::mutex mutex_;
    Factory factory_;
    std::unique_ptr<T> value_;
    std::uint64_t generation_{0};
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_LAZY_RESOURCE_HPP
