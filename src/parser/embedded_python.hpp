#pragma once

#include <optional>
#include <string_view>
#include <pybind11/embed.h>
#include "core/errors/scriptbox_errors.hpp"

namespace scriptbox::parser {

namespace py = pybind11;

// Starts the process-wide interpreter on first call and releases the GIL, so
// any thread can take py::gil_scoped_acquire afterwards. The interpreter is
// never finalized. Returns the startup failure, which is sticky.
std::optional<core::errors::ScriptboxError> start_interpreter();

// ast.parse() over the raw script bytes, so PEP 263 coding cookies and invalid
// UTF-8 behave as they do for `python3 script.py`. The GIL must be held.
//
// SyntaxError, and the RecursionError/MemoryError CPython raises for input too
// deeply nested to build a tree for, come back as a Validation error with code
// "syntax_error" and a "(line L, column C)" suffix when the position is known.
core::errors::Result<py::object> parse_module(std::string_view source);

}  // namespace scriptbox::parser
