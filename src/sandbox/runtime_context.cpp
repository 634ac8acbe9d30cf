/*
 * runtime_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "runtime_context.hpp"

#include <pybind11/stl.h>
#include <spdlog/spdlog.h>

#include "prelude.hpp"

namespace assay::sandbox {

RuntimeContext::RuntimeContext(config::SandboxConfig config)
    : config_(std::move(config)),
      engine_([this] { return buildEngine(); }) {
    if (Py_IsInitialized() == 0) {
        spdlog::info("Initializing Python interpreter");
        interpreter_ = std::make_unique<py::scoped_interpreter>();
        released_ = std::make_unique<py::gil_scoped_release>();
    } else {
        spdlog::debug("Python interpreter already running, attaching");
    }
}

RuntimeContext::~RuntimeContext() {
    if (interpreter_) {
        released_.reset();
        engine_.invalidate();
        spdlog::info("Shutting down Python interpreter");
        interpreter_.reset();
        return;
    }
    py::gil_scoped_acquire gil;
    engine_.invalidate();
}

auto RuntimeContext::buildEngine() -> std::unique_ptr<HelperEngine> {
    spdlog::debug("Building sandbox helper engine");

    py::module_ types = py::module_::import("types");
    py::module_ prelude = types.attr("ModuleType")("_assay_prelude");
    py::dict scope = prelude.attr("__dict__");
    py::exec(kPreludeSource, scope);

    auto engine = std::make_unique<HelperEngine>();
    engine->prelude = prelude;
    engine->interruptType = prelude.attr("SandboxInterrupt");
    engine->helpers = prelude.attr("load_helpers")(config_.enableDataHelpers)
                          .cast<std::vector<std::string>>();

    std::string names;
    for (const auto& helper : engine->helpers) {
        names += names.empty() ? helper : ", " + helper;
    }
    spdlog::info("Sandbox helper engine ready (helpers: {})",
                 names.empty() ? "none" : names);
    return engine;
}

auto RuntimeContext::engine() -> HelperEngine& {
    HelperEngine& current = engine_.get();
    bool healthy = false;
    try {
        healthy = current.prelude.attr("healthy")().cast<bool>();
    } catch (const py::error_already_set& e) {
        spdlog::warn("Helper engine health check failed: {}", e.what());
    }
    if (healthy) {
        return current;
    }
    spdlog::warn("Rebuilding sandbox helper engine");
    engine_.invalidate();
    return engine_.get();
}

void RuntimeContext::invalidate() {
    spdlog::warn("Sandbox helper engine invalidated");
    engine_.invalidate();
}

auto RuntimeContext::generation() const -> std::uint64_t {
    return engine_.generation();
}

}  // namespace assay::sandbox
