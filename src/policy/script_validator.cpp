#include "policy/script_validator.hpp"

#include <algorithm>
#include <optional>
#include <unordered_set>
#include <utility>
#include <vector>
#include "parser/embedded_python.hpp"

namespace scriptbox::policy {

namespace py = pybind11;

namespace {

constexpr const char* kRejectionPrefix =
    "Script contains disallowed or suspicious constructs: ";

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](const char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    });
}

bool is_blocked_module(const Denylist& denylist, const std::string& name) {
    return std::any_of(denylist.blocked_modules.begin(), denylist.blocked_modules.end(),
                       [&name](const std::string& blocked) {
                           return name == blocked || name.rfind(blocked + ".", 0) == 0;
                       });
}

std::string str_attr(const py::handle& node, const char* name) {
    return node.attr(name).cast<std::string>();
}

int line_of(const py::handle& node) {
    const py::object lineno = py::getattr(node, "lineno", py::none());
    return py::isinstance<py::int_>(lineno) ? lineno.cast<int>() : 0;
}

// Node classes of the `ast` module the scan dispatches on.
struct AstTypes {
    explicit AstTypes(const py::module_& ast)
        : call(ast.attr("Call")),
          name(ast.attr("Name")),
          attribute(ast.attr("Attribute")),
          import(ast.attr("Import")),
          import_from(ast.attr("ImportFrom")),
          function_def(ast.attr("FunctionDef")),
          async_function_def(ast.attr("AsyncFunctionDef")) {}

    py::object call;
    py::object name;
    py::object attribute;
    py::object import;
    py::object import_from;
    py::object function_def;
    py::object async_function_def;
};

// "a.b.c" for a chain of at most `max_segments` Name/Attribute nodes, nullopt
// for longer chains or anything else (calls, subscripts, literals) in the
// chain. The bound keeps the cost per Attribute node constant.
std::optional<std::string> dotted_name(const py::handle& node, const AstTypes& types,
                                       const std::size_t max_segments) {
    std::vector<std::string> attributes;
    py::object current = py::reinterpret_borrow<py::object>(node);
    while (attributes.size() < max_segments) {
        if (py::isinstance(current, types.name)) {
            std::string dotted = str_attr(current, "id");
            for (auto it = attributes.rbegin(); it != attributes.rend(); ++it) {
                dotted += "." + *it;
            }
            return dotted;
        }
        if (!py::isinstance(current, types.attribute)) {
            return std::nullopt;
        }
        attributes.push_back(str_attr(current, "attr"));
        current = current.attr("value");
    }
    return std::nullopt;
}

bool has_top_level_main(const py::object& tree, const AstTypes& types) {
    const py::list body = tree.attr("body");
    for (const py::handle statement : body) {
        if (py::isinstance(statement, types.function_def) &&
            str_attr(statement, "name") == "main") {
            return true;
        }
    }
    return false;
}

// One pass of ast.walk() over a parsed module, appending an issue per
// denylisted construct.
class AstScanner {
public:
    AstScanner(const Denylist& denylist, const std::size_t max_object_segments,
               const py::module_& ast)
        : denylist_(denylist), max_object_segments_(max_object_segments), ast_(ast),
          types_(ast) {}

    void scan(const py::object& tree, std::vector<ValidationIssue>& issues) const {
        std::size_t function_count = 0;
        for (const py::handle node : ast_.attr("walk")(tree)) {
            if (py::isinstance(node, types_.function_def) ||
                py::isinstance(node, types_.async_function_def)) {
                ++function_count;
            } else if (py::isinstance(node, types_.call)) {
                check_call(node, issues);
            } else if (py::isinstance(node, types_.import)) {
                const py::list names = node.attr("names");
                for (const py::handle alias : names) {
                    const std::string module = str_attr(alias, "name");
                    if (is_blocked_module(denylist_, module)) {
                        issues.push_back({ValidationIssueKind::DisallowedImport,
                                          "Import of '" + module +
                                              "' is disallowed or flagged as suspicious.",
                                          line_of(node)});
                    }
                }
            } else if (py::isinstance(node, types_.import_from)) {
                // `from . import x` has no module; relative dots live in `level`.
                const py::object module = node.attr("module");
                if (!module.is_none() &&
                    is_blocked_module(denylist_, module.cast<std::string>())) {
                    issues.push_back({ValidationIssueKind::DisallowedImport,
                                      "Import-from '" + module.cast<std::string>() +
                                          "' is disallowed or flagged as suspicious.",
                                      line_of(node)});
                }
            } else if (py::isinstance(node, types_.name)) {
                const std::string id = str_attr(node, "id");
                if (denylist_.blocked_references.count(id) > 0) {
                    issues.push_back({ValidationIssueKind::DisallowedNameReference,
                                      "Reference to '" + id + "' is disallowed.",
                                      line_of(node)});
                }
            } else if (py::isinstance(node, types_.attribute)) {
                const auto dotted = blocked_attribute(node);
                if (dotted.has_value()) {
                    issues.push_back({ValidationIssueKind::DisallowedAttributeAccess,
                                      "Use of attribute '" + *dotted + "' is disallowed.",
                                      line_of(node)});
                }
            }
        }

        if (function_count > denylist_.max_function_definitions) {
            issues.push_back({ValidationIssueKind::TooManyDefinitions,
                              "Too many function definitions (" +
                                  std::to_string(function_count) + " > " +
                                  std::to_string(denylist_.max_function_definitions) + ")."});
        }
    }

    bool has_entry_point(const py::object& tree) const { return has_top_level_main(tree, types_); }

private:
    void check_call(const py::handle& call, std::vector<ValidationIssue>& issues) const {
        const py::object callee = call.attr("func");
        if (py::isinstance(callee, types_.name)) {
            const std::string id = str_attr(callee, "id");
            if (denylist_.blocked_calls.count(id) > 0) {
                issues.push_back({ValidationIssueKind::DisallowedCall,
                                  "Use of '" + id + "()' is disallowed for security reasons.",
                                  line_of(call)});
            }
        } else if (py::isinstance(callee, types_.attribute)) {
            const auto dotted = blocked_attribute(callee);
            if (dotted.has_value()) {
                issues.push_back({ValidationIssueKind::DisallowedCall,
                                  "Use of '" + *dotted + "()' is disallowed for security reasons.",
                                  line_of(call)});
            }
        }
    }

    // "obj.attr" when the Attribute node matches blocked_attributes.
    std::optional<std::string> blocked_attribute(const py::handle& attribute) const {
        const py::object value = attribute.attr("value");
        const auto object = dotted_name(value, types_, max_object_segments_);
        if (!object.has_value()) {
            return std::nullopt;
        }
        const std::string attr = str_attr(attribute, "attr");
        if (denylist_.blocked_attributes.count({*object, attr}) == 0) {
            return std::nullopt;
        }
        return *object + "." + attr;
    }

    const Denylist& denylist_;
    std::size_t max_object_segments_;
    const py::module_& ast_;
    AstTypes types_;
};

// Issues that stand on their own when they are the only one reported.
bool is_standalone(const ValidationIssueKind kind) {
    return kind == ValidationIssueKind::EmptyScript ||
           kind == ValidationIssueKind::ScriptTooLarge ||
           kind == ValidationIssueKind::SyntaxInvalid ||
           kind == ValidationIssueKind::MissingEntryPoint ||
           kind == ValidationIssueKind::AnalysisFailed;
}

}  // namespace

std::string to_string(const ValidationIssueKind kind) {
    switch (kind) {
        case ValidationIssueKind::EmptyScript:
            return "empty-script";
        case ValidationIssueKind::ScriptTooLarge:
            return "script-too-large";
        case ValidationIssueKind::SyntaxInvalid:
            return "syntax-invalid";
        case ValidationIssueKind::MissingEntryPoint:
            return "missing-entry-point";
        case ValidationIssueKind::DisallowedCall:
            return "disallowed-call";
        case ValidationIssueKind::DisallowedImport:
            return "disallowed-import";
        case ValidationIssueKind::DisallowedAttributeAccess:
            return "disallowed-attribute-access";
        case ValidationIssueKind::DisallowedNameReference:
            return "disallowed-name-reference";
        case ValidationIssueKind::TooManyDefinitions:
            return "too-many-definitions";
        case ValidationIssueKind::AnalysisFailed:
            return "analysis-failed";
        default:
            return "unknown";
    }
}

ValidationReport::ValidationReport(std::vector<ValidationIssue> issues) {
    std::unordered_set<std::string> seen;
    for (auto& issue : issues) {
        if (seen.insert(issue.detail).second) {
            issues_.push_back(std::move(issue));
        }
    }
}

std::string ValidationReport::summary(const std::size_t max_issues) const {
    if (issues_.empty()) {
        return "";
    }
    if (issues_.size() == 1 && is_standalone(issues_.front().kind)) {
        return issues_.front().detail;
    }

    std::string joined;
    const std::size_t count = std::min(max_issues, issues_.size());
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) {
            joined += "; ";
        }
        joined += issues_[i].detail;
    }
    return kRejectionPrefix + joined;
}

ScriptValidator::ScriptValidator(Denylist denylist) : denylist_(std::move(denylist)) {
    for (const auto& blocked : denylist_.blocked_attributes) {
        const std::size_t segments =
            static_cast<std::size_t>(std::count(blocked.first.begin(), blocked.first.end(), '.')) + 1;
        max_object_segments_ = std::max(max_object_segments_, segments);
    }
}

ValidationReport ScriptValidator::validate(std::string_view script) const {
    std::vector<ValidationIssue> issues;
    if (is_blank(script)) {
        issues.push_back(
            {ValidationIssueKind::EmptyScript, "'script' must be a non-empty string."});
        return ValidationReport(std::move(issues));
    }
    if (script.size() > denylist_.max_script_bytes) {
        issues.push_back({ValidationIssueKind::ScriptTooLarge,
                          "Script too large (>" +
                              std::to_string(denylist_.max_script_bytes) + " bytes)."});
        return ValidationReport(std::move(issues));
    }

    if (const auto failure = parser::start_interpreter()) {
        issues.push_back({ValidationIssueKind::AnalysisFailed,
                          "Script could not be analysed: " + failure->message});
        return ValidationReport(std::move(issues));
    }

    py::gil_scoped_acquire gil;
    try {
        const auto parsed = parser::parse_module(script);
        if (core::errors::is_error(parsed)) {
            const auto& error = core::errors::get_error(parsed);
            if (error.category == core::errors::ErrorCategory::Validation) {
                issues.push_back({ValidationIssueKind::SyntaxInvalid,
                                  "Script is syntactically invalid Python: " + error.message});
            } else {
                issues.push_back({ValidationIssueKind::AnalysisFailed,
                                  "Script could not be analysed: " + error.message});
            }
        } else {
            const py::module_ ast = py::module_::import("ast");
            const AstScanner scanner(denylist_, max_object_segments_, ast);
            const py::object& tree = core::errors::get_value(parsed);
            if (!scanner.has_entry_point(tree)) {
                issues.push_back({ValidationIssueKind::MissingEntryPoint,
                                  "Script must define a top-level function named 'main()'."});
            }
            scanner.scan(tree, issues);
        }
    } catch (const py::error_already_set& e) {
        issues.push_back({ValidationIssueKind::AnalysisFailed,
                          std::string("Script could not be analysed: ") + e.what()});
    } catch (const py::cast_error& e) {
        issues.push_back({ValidationIssueKind::AnalysisFailed,
                          std::string("Script could not be analysed: ") + e.what()});
    }
    return ValidationReport(std::move(issues));
}

}  // namespace scriptbox::policy
