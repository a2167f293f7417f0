#pragma once

#include <optional>
#include <string>
#include <vector>

namespace kivybot::inspect {

enum class RuleKind {
    kLaunchCall,
    kFrameworkImport,
    kDanger
};

// One entry of the ordered rule tables. `case_sensitive == false` matches against
// the lowercased snippet.
struct InspectionRule {
    std::string pattern;
    RuleKind kind;
    bool case_sensitive = true;
};

struct DisplayHint {
    std::optional<int> width;
    std::optional<int> height;
    std::string source = "none";

    bool IsExplicit() const { return source != "none"; }
};

struct SafetyVerdict {
    bool allowed = true;
    std::string matched_pattern;
};

class CodeInspector {
public:
    CodeInspector();
    explicit CodeInspector(bool reject_dangerous_code);

    // Fenced ```py / ```python blocks, in order, trimmed; blank blocks are dropped.
    static std::vector<std::string> ExtractSnippets(const std::string& text);

    // True only when the snippet has both a launch call and a framework import.
    bool Classify(const std::string& snippet) const;

    static DisplayHint ParseDisplayHint(const std::string& snippet);

    // With rejection disabled every snippet is allowed; isolation then rests on the
    // sandbox resource and network limits alone.
    SafetyVerdict CheckSafety(const std::string& snippet) const;

    // First extracted block that Classify accepts.
    std::optional<std::string> SelectRenderable(const std::string& text) const;

    bool RejectsDangerousCode() const { return reject_dangerous_code_; }
    const std::vector<InspectionRule>& Rules() const { return rules_; }

private:
    bool Matches(const InspectionRule& rule,
                 const std::string& snippet,
                 const std::string& lowered) const;

    bool reject_dangerous_code_ = true;
    std::vector<InspectionRule> rules_;
};

}  // namespace kivybot::inspect
