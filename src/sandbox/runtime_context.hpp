/*
 * runtime_context.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file runtime_context.hpp
 * @brief Process-wide Python runtime and the sandbox helper engine
 *
 * The context starts the embedded interpreter when nobody else has,
 * then gives up the GIL so any thread may enter it. The helper engine
 * (prelude module and optional data helpers) is built on first use and
 * rebuilt after invalidate().
 */

#ifndef ASSAY_SANDBOX_RUNTIME_CONTEXT_HPP
#define ASSAY_SANDBOX_RUNTIME_CONTEXT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <pybind11/embed.h>

#include "atom/type/noncopyable.hpp"

#include "config/sections/sandbox_config.hpp"
#include "lazy_resource.hpp"

namespace assay::sandbox {

namespace py = pybind11;

/**
 * @brief Objects built once per engine generation
 */
struct HelperEngine {
    py::module_ prelude;
    py::object interruptType;  ///< SandboxInterrupt
    std::vector<std::string> helpers;
};

class RuntimeContext : public NonCopyable {
public:
    explicit RuntimeContext(config::SandboxConfig config);
    ~RuntimeContext();

    /**
     * @brief The helper engine, built or rebuilt as needed
     *
     * The caller must hold the GIL. An engine that fails its health
     * check is dropped and rebuilt once.
     *
     * @throws py::error_already_set if the prelude cannot be built
     */
    auto engine() -> HelperEngine&;

    /**
     * @brief Drop the engine; the next engine() call rebuilds it
     *
     * The caller must hold the GIL.
     */
    void invalidate();

    [[nodiscard]] auto generation() const -> std::uint64_t;

    [[nodiscard]] auto config() const -> const config::SandboxConfig& {
        return config_;
    }

    /**
     * @brief Whether this context started the interpreter
     */
    [[nodiscard]] auto ownsInterpreter() const noexcept -> bool {
        return interpreter_ != nullptr;
    }

private:
    auto buildEngine() -> std::unique_ptr<HelperEngine>;

    config::SandboxConfig config_;
    std::unique_ptr<py::scoped_interpreter> interpreter_;
    std::unique_ptr<py::gil_scoped_release> released_;
    LazyResource<HelperEngine> engine_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_RUNTIME_CONTEXT_HPP
