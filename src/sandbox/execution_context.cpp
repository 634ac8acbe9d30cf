/*
 * execution_context.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "execution_context.hpp"

#include <atomic>
#include <mutex>

#include <pybind11/embed.h>
#include <pybind11/stl.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace assay::sandbox {

namespace {

constexpr std::string_view kVariableTruncated = "... [truncated]";

auto dumpReply(const json& reply) -> std::string {
    return reply.dump(-1, ' ', false, json::error_handler_t::replace);
}

auto parseArguments(const std::string& payload) -> std::optional<json> {
    try {
        return json::parse(payload);
    } catch (const json::parse_error& e) {
        spdlog::debug("Malformed bridge payload: {}", e.what());
        return std::nullopt;
    }
}

/**
 * sys.stdout / sys.stderr replacement writing into the run's capture.
 */
class OutputSink {
public:
    OutputSink(std::shared_ptr<OutputCapture> capture, OutputStream stream)
        : capture_(std::move(capture)), stream_(stream) {}

    auto write(const std::string& text) -> size_t {
        capture_->write(stream_, text);
        return text.size();
    }

    void flush() {}

private:
    std::shared_ptr<OutputCapture> capture_;
    OutputStream stream_;
};

/**
 * Tool bridge as seen from Python: JSON text in, JSON text out.
 */
class BridgeHandle {
public:
    explicit BridgeHandle(std::shared_ptr<HostEndpoint> host)
        : host_(std::move(host)) {}

    auto call(const std::string& name, const std::string& payload)
        -> std::string {
        auto arguments = parseArguments(payload);
        if (!arguments) {
            return dumpReply(bridge::errorResult(
                "arguments could not be encoded", "ValidationError"));
        }
        return dumpReply(host_->call(name, *arguments));
    }

    auto describe() -> std::string { return dumpReply(host_->describe()); }

private:
    std::shared_ptr<HostEndpoint> host_;
};

/**
 * Read-only data proxy as seen from Python.
 */
class DataHandle {
public:
    explicit DataHandle(std::shared_ptr<HostEndpoint> host)
        : host_(std::move(host)) {}

    auto query(const std::string& statement, const std::string& params)
        -> std::string {
        auto bound = parseArguments(params);
        if (!bound) {
            return dumpReply(bridge::errorResult(
                "params could not be encoded", "QueryError"));
        }
        return dumpReply(host_->data(
            "query", {{"statement", statement}, {"params", *bound}}));
    }

    auto exists(const std::string& source, const std::string& filters)
        -> std::string {
        return filtered("exists", source, filters, json::object());
    }

    auto count(const std::string& source, const std::string& filters)
        -> std::string {
        return filtered("count", source, filters, json::object());
    }

    auto getValue(const std::string& source, const std::string& filters,
                  const std::string& field) -> std::string {
        return filtered("get_value", source, filters, {{"field", field}});
    }

    auto describe(const std::string& source) -> std::string {
        return dumpReply(host_->data("describe", {{"source", source}}));
    }

private:
    auto filtered(const std::string& operation, const std::string& source,
                  const std::string& filters, json arguments) -> std::string {
        auto parsed = parseArguments(filters);
        if (!parsed) {
            return dumpReply(bridge::errorResult(
                "filters could not be encoded", "QueryError"));
        }
        arguments["source"] = source;
        arguments["filters"] = std::move(*parsed);
        return dumpReply(host_->data(operation, arguments));
    }

    std::shared_ptr<HostEndpoint> host_;
};

/**
 * Delivers SandboxInterrupt to the executing thread while armed.
 *
 * Lock order is GIL, then mutex_.
 */
class Interruptor {
public:
    void arm(unsigned long threadId, PyObject* type) {
        std::lock_guard lock(mutex_);
        threadId_ = threadId;
        type_ = type;
        armed_ = true;
        tripped_.store(false);
    }

    void disarm() {
        std::lock_guard lock(mutex_);
        if (!armed_) {
            return;
        }
        armed_ = false;
        // Drop anything posted but not yet raised
        PyThreadState_SetAsyncExc(threadId_, nullptr);
    }

    void interrupt(LimitKind kind) {
        kind_.store(static_cast<int>(kind));
        tripped_.store(true);
        py::gil_scoped_acquire gil;
        std::lock_guard lock(mutex_);
        if (armed_) {
            PyThreadState_SetAsyncExc(threadId_, type_);
        }
    }

    /**
     * @brief Whether a limit has tripped since arm(); lock free
     */
    [[nodiscard]] auto tripped() const noexcept -> bool {
        return tripped_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto type() const noexcept -> PyObject* { return type_; }

    [[nodiscard]] auto lastKind() const -> std::optional<LimitKind> {
        int value = kind_.load();
        if (value < 0) {
            return std::nullopt;
        }
        return static_cast<LimitKind>(value);
    }

private:
    std::mutex mutex_;
    bool armed_{false};
    unsigned long threadId_{0};
    PyObject* type_{nullptr};
    std::atomic<int> kind_{-1};
    std::atomic<bool> tripped_{false};
};

/**
 * Raises SandboxInterrupt at the next line or call once the interruptor
 * has tripped, so code that catches the asynchronous exception and keeps
 * looping is still stopped.
 */
auto interruptTrace(PyObject* self, PyFrameObject* /*frame*/, int what,
                    PyObject* /*arg*/) -> int {
    auto* interruptor =
        static_cast<Interruptor*>(PyCapsule_GetPointer(self, nullptr));
    if (interruptor == nullptr) {
        return -1;
    }
    if ((what == PyTrace_LINE || what == PyTrace_CALL) &&
        interruptor->tripped()) {
        PyErr_SetNone(interruptor->type());
        return -1;
    }
    return 0;
}

/**
 * Installs interruptTrace on the calling thread for a scope.
 */
class TraceScope {
public:
    explicit TraceScope(Interruptor& interruptor)
        : capsule_(static_cast<void*>(&interruptor)) {
        PyEval_SetTrace(&interruptTrace, capsule_.ptr());
    }
    ~TraceScope() { PyEval_SetTrace(nullptr, nullptr); }

    TraceScope(const TraceScope&) = delete;
    TraceScope& operator=(const TraceScope&) = delete;

private:
    py::capsule capsule_;
};

/**
 * Arms the interruptor for a scope.
 */
class ArmedScope {
public:
    ArmedScope(Interruptor& interruptor, PyObject* type)
        : interruptor_(interruptor) {
        interruptor_.arm(PyThread_get_thread_ident(), type);
    }
    ~ArmedScope() { interruptor_.disarm(); }

    ArmedScope(const ArmedScope&) = delete;
    ArmedScope& operator=(const ArmedScope&) = delete;

private:
    Interruptor& interruptor_;
};

/**
 * Points sys.stdout / sys.stderr at the capture for a scope.
 */
class StreamRedirect {
public:
    explicit StreamRedirect(const std::shared_ptr<OutputCapture>& capture)
        : sys_(py::module_::import("sys")),
          savedOut_(sys_.attr("stdout")),
          savedErr_(sys_.attr("stderr")) {
        sys_.attr("stdout") = py::cast(OutputSink(capture, OutputStream::Stdout));
        sys_.attr("stderr") = py::cast(OutputSink(capture, OutputStream::Stderr));
    }

    ~StreamRedirect() {
        try {
            sys_.attr("stdout") = savedOut_;
            sys_.attr("stderr") = savedErr_;
        } catch (const py::error_already_set& e) {
            spdlog::error("Failed to restore standard streams: {}", e.what());
        }
    }

    StreamRedirect(const StreamRedirect&) = delete;
    StreamRedirect& operator=(const StreamRedirect&) = delete;

private:
    py::module_ sys_;
    py::object savedOut_;
    py::object savedErr_;
};

}  // namespace

}  // namespace assay::sandbox

PYBIND11_EMBEDDED_MODULE(_assay_host, m) {
    using namespace assay::sandbox;

    m.doc() = "Host objects bound into sandbox namespaces";

    py::class_<OutputSink>(m, "OutputSink")
        .def("write", &OutputSink::write)
        .def("flush", &OutputSink::flush)
        .def("isatty", [](const OutputSink&) { return false; })
        .def("writable", [](const OutputSink&) { return true; })
        .def_property_readonly("encoding",
                               [](const OutputSink&) { return "utf-8"; });

    py::class_<BridgeHandle>(m, "BridgeHandle")
        .def("call", &BridgeHandle::call,
             py::call_guard<py::gil_scoped_release>())
        .def("describe", &BridgeHandle::describe,
             py::call_guard<py::gil_scoped_release>());

    py::class_<DataHandle>(m, "DataHandle")
        .def("query", &DataHandle::query,
             py::call_guard<py::gil_scoped_release>())
        .def("exists", &DataHandle::exists,
             py::call_guard<py::gil_scoped_release>())
        .def("count", &DataHandle::count,
             py::call_guard<py::gil_scoped_release>())
        .def("get_value", &DataHandle::getValue,
             py::call_guard<py::gil_scoped_release>())
        .def("describe", &DataHandle::describe,
             py::call_guard<py::gil_scoped_release>());
}

namespace assay::sandbox {

class ExecutionContext::Impl {
public:
    Impl(RuntimeContext& runtime, const ExecutionRequest& request,
         RunBindings bindings)
        : runtime_(runtime),
          code_(request.code),
          returnVariables_(request.returnVariables),
          variableCeiling_(runtime.config().variableCeilingBytes),
          bindings_(std::move(bindings)) {
        py::module_::import("_assay_host");

        HelperEngine& engine = runtime_.engine();
        prelude_ = engine.prelude;
        interruptType_ = engine.interruptType;
        helpers_ = engine.helpers;

        const auto& config = runtime_.config();
        namespace_ = prelude_.attr("make_namespace")(config.allowedModules,
                                                     config.enableDataHelpers);
        prelude_.attr("bind_host")(namespace_, BridgeHandle(bindings_.host),
                                   DataHandle(bindings_.host));
        if (bindings_.prefetch) {
            prelude_.attr("bind_prefetch")(namespace_,
                                           dumpReply(*bindings_.prefetch));
        }
    }

    auto hooks() -> InterpreterHooks {
        InterpreterHooks hooks;
        hooks.recursionLimit = [] { return Py_GetRecursionLimit(); };
        hooks.setRecursionLimit = [](int limit) { Py_SetRecursionLimit(limit); };
        hooks.interrupt = [this](LimitKind kind) {
            interruptor_.interrupt(kind);
        };
        hooks.withInterpreterReleased =
            [](const std::function<void()>& action) {
                py::gil_scoped_release release;
                action();
            };
        return hooks;
    }

    auto execute() -> ScriptOutcome {
        StreamRedirect redirect(bindings_.capture);
        ArmedScope armed(interruptor_, interruptType_.ptr());

        std::optional<py::error_already_set> failure;
        {
            TraceScope trace(interruptor_);
            auto compiled = py::reinterpret_steal<py::object>(
                Py_CompileString(code_.c_str(), "<sandbox>", Py_file_input));
            if (compiled) {
                auto result = py::reinterpret_steal<py::object>(
                    PyEval_EvalCode(compiled.ptr(), namespace_.ptr(),
                                    namespace_.ptr()));
                if (!result) {
                    failure.emplace();
                }
            } else {
                failure.emplace();
            }
        }

        ScriptOutcome outcome;
        outcome.helpers = helpers_;
        if (failure) {
            outcome.raised = translate(*failure);
        }
        collectVariables(outcome);
        release();
        return outcome;
    }

private:
    /**
     * Limit-shaped exceptions leave as LimitExceeded; anything else
     * becomes the run's raised error.
     */
    auto translate(py::error_already_set& error) -> RaisedError {
        if (error.matches(interruptType_)) {
            auto kind = interruptor_.lastKind().value_or(LimitKind::Timeout);
            THROW_LIMIT_EXCEEDED(kind, "run interrupted by the " +
                                           std::string(limitKindToString(kind)) +
                                           " watchdog");
        }
        if (error.matches(PyExc_MemoryError)) {
            THROW_LIMIT_EXCEEDED(LimitKind::Memory, "MemoryError raised");
        }
        if (error.matches(PyExc_RecursionError)) {
            THROW_LIMIT_EXCEEDED(LimitKind::Recursion, "RecursionError raised");
        }

        RaisedError raised;
        raised.type = describeType(error);
        try {
            raised.message = py::str(error.value()).cast<std::string>();
            raised.traceback = prelude_.attr("format_exception")(error.value())
                                   .cast<std::string>();
        } catch (const py::error_already_set& nested) {
            if (nested.matches(interruptType_)) {
                throw;
            }
            raised.traceback = error.what();
        }

        if (error.matches(PyExc_SystemError)) {
            spdlog::error("Interpreter reported SystemError: {}", error.what());
            runtime_.invalidate();
        }
        return raised;
    }

    static auto describeType(const py::error_already_set& error)
        -> std::string {
        try {
            return error.type().attr("__name__").cast<std::string>();
        } catch (const py::error_already_set&) {
            return "Exception";
        }
    }

    void collectVariables(ScriptOutcome& outcome) {
        for (const auto& name : returnVariables_) {
            if (!namespace_.contains(name)) {
                continue;
            }
            std::string text;
            try {
                text = prelude_.attr("render_value")(namespace_[name.c_str()])
                           .cast<std::string>();
            } catch (const py::error_already_set& e) {
                if (e.matches(interruptType_)) {
                    throw;
                }
                text = "<unrenderable: " + std::string(e.what()) + ">";
            }
            if (text.size() > variableCeiling_) {
                text.resize(utf8SafePrefix(text, variableCeiling_));
                text += kVariableTruncated;
            }
            outcome.variables.emplace(name, std::move(text));
        }
    }

    /**
     * Drop the run's objects while the interruptor is still armed, so a
     * finaliser that never returns is still bounded by the watchdog.
     */
    void release() {
        namespace_.clear();
        py::module_::import("gc").attr("collect")();
    }

    RuntimeContext& runtime_;
    std::string code_;
    std::vector<std::string> returnVariables_;
    size_t variableCeiling_;
    RunBindings bindings_;

    py::module_ prelude_;
    py::object interruptType_;
    std::vector<std::string> helpers_;
    py::dict namespace_;
    Interruptor interruptor_;
};

ExecutionContext::ExecutionContext(RuntimeContext& runtime,
                                   const ExecutionRequest& request,
                                   RunBindings bindings)
    : impl_(std::make_unique<Impl>(runtime, request, std::move(bindings))) {}

ExecutionContext::~ExecutionContext() = default;

auto ExecutionContext::hooks() -> InterpreterHooks { return impl_->hooks(); }

auto ExecutionContext::execute() -> ScriptOutcome { return impl_->execute(); }

}  // namespace assay::sandbox
