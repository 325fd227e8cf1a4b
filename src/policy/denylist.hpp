#pragma once

#include <cstddef>
#include <set>
#include <string>
#include <utility>

namespace scriptbox::policy {

// Immutable screening policy handed to ScriptValidator. Default members are the
// production denylist; tests build alternates by assigning fields.
struct Denylist {
    // Bare callees, e.g. eval(...).
    std::set<std::string> blocked_calls = {
        "eval",     "exec",       "compile",     "importlib",       "ctypes",
        "ctypes.util", "subprocess", "socket",  "multiprocessing", "threading",
        "os.system", "sys.modules", "__import__"};

    // `import x` / `from x import y`: x matches an entry or is a dotted sub-path of one.
    std::set<std::string> blocked_modules = {
        "eval",     "exec",       "compile",     "importlib",       "ctypes",
        "ctypes.util", "subprocess", "socket",  "multiprocessing", "threading",
        "os.system", "sys.modules", "__import__"};

    // (object, attribute) pairs, flagged both when called and when referenced.
    std::set<std::pair<std::string, std::string>> blocked_attributes = {
        {"os", "system"},  {"os", "popen"},  {"os", "execv"},
        {"os", "execl"},   {"os", "execvp"}, {"os", "execve"},
        {"os", "spawnv"},  {"os", "spawnl"}, {"os", "fork"},
        {"sys", "exec_prefix"}, {"sys", "modules"}};

    // Names flagged even when not called.
    std::set<std::string> blocked_references = {"eval", "exec", "__import__"};

    std::size_t max_script_bytes = 200 * 1024;
    std::size_t max_function_definitions = 100;
};

}  // namespace scriptbox::policy
