#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "policy/denylist.hpp"

namespace scriptbox::policy {

enum class ValidationIssueKind {
    EmptyScript,
    ScriptTooLarge,
    SyntaxInvalid,
    MissingEntryPoint,
    DisallowedCall,
    DisallowedImport,
    DisallowedAttributeAccess,
    DisallowedNameReference,
    TooManyDefinitions,
    AnalysisFailed
};

std::string to_string(ValidationIssueKind kind);

struct ValidationIssue {
    ValidationIssueKind kind;
    std::string detail;
    // 1-based source line, 0 when the issue is not tied to one.
    int line = 0;
};

class ValidationReport {
public:
    ValidationReport() = default;
    explicit ValidationReport(std::vector<ValidationIssue> issues);

    bool accepted() const { return issues_.empty(); }
    const std::vector<ValidationIssue>& issues() const { return issues_; }

    // Single caller-facing message. Empty when accepted.
    std::string summary(std::size_t max_issues = 5) const;

private:
    std::vector<ValidationIssue> issues_;
};

class ScriptValidator {
public:
    explicit ScriptValidator(Denylist denylist = {});

    ValidationReport validate(std::string_view script) const;

    const Denylist& denylist() const { return denylist_; }

private:
    Denylist denylist_;
    // Longest dotted object in blocked_attributes, in segments ("os" is 1).
    std::size_t max_object_segments_ = 0;
};

}  // namespace scriptbox::policy
