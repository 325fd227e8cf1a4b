#include "parser/embedded_python.hpp"

#include <exception>
#include <mutex>
#include <string>
#include "core/logging/logger.hpp"

namespace scriptbox::parser {

using core::errors::ErrorCategory;
using core::errors::ScriptboxError;

namespace {

std::once_flag g_start_once;
std::optional<ScriptboxError> g_start_error;

// " (line L, column C)" from a SyntaxError, empty when CPython gave no position.
std::string position_suffix(const py::object& error) {
    const py::object lineno = error.attr("lineno");
    if (!py::isinstance<py::int_>(lineno)) {
        return "";
    }
    std::string suffix = " (line " + std::to_string(lineno.cast<long>());
    const py::object offset = error.attr("offset");
    if (py::isinstance<py::int_>(offset)) {
        suffix += ", column " + std::to_string(offset.cast<long>());
    }
    return suffix + ")";
}

}  // namespace

std::optional<ScriptboxError> start_interpreter() {
    std::call_once(g_start_once, []() {
        if (Py_IsInitialized()) {
            return;
        }
        try {
            // No Python signal handlers: SIGINT/SIGTERM stay with the host process.
            py::initialize_interpreter(false);
        } catch (const std::exception& e) {
            g_start_error = ScriptboxError{ErrorCategory::Internal,
                                           std::string("Failed to start embedded Python: ") +
                                               e.what(),
                                           "python_start_failed"};
            LOG_ERROR(g_start_error->message);
            return;
        }
        // The thread state is intentionally dropped: the interpreter lives
        // until process exit and every later use goes through gil_scoped_acquire.
        static_cast<void>(PyEval_SaveThread());
        LOG_DEBUG(std::string("Embedded Python ") + Py_GetVersion());
    });
    return g_start_error;
}

core::errors::Result<py::object> parse_module(std::string_view source) {
    try {
        const py::module_ ast = py::module_::import("ast");
        return ast.attr("parse")(py::bytes(source.data(), source.size()), "<script>", "exec");
    } catch (py::error_already_set& e) {
        if (e.matches(PyExc_SyntaxError)) {
            const py::object error = e.value();
            return ScriptboxError{ErrorCategory::Validation,
                                  py::str(error.attr("msg")).cast<std::string>() +
                                      position_suffix(error),
                                  "syntax_error"};
        }
        if (e.matches(PyExc_RecursionError) || e.matches(PyExc_MemoryError) ||
            e.matches(PyExc_ValueError)) {
            return ScriptboxError{ErrorCategory::Validation,
                                  py::str(e.value()).cast<std::string>(), "syntax_error"};
        }
        return ScriptboxError{ErrorCategory::Internal,
                              std::string("ast.parse failed: ") + e.what(),
                              "python_ast_failed"};
    }
}

}  // namespace scriptbox::parser
