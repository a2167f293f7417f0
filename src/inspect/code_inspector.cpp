#include "inspect/code_inspector.hpp"

#include <cctype>
#include <cmath>
#include <regex>

#include "utils/common.hpp"

namespace kivybot::inspect {
namespace {

constexpr const char* kFence = "```";

std::vector<InspectionRule> BuildRuleTable() {
    return {
        {".run()", RuleKind::kLaunchCall, true},
        {"runTouchApp(", RuleKind::kLaunchCall, true},
        {"async_runTouchApp", RuleKind::kLaunchCall, true},
        {"trio.run", RuleKind::kLaunchCall, true},
        // also covers kivymd and kivy_reloader
        {"from kivy", RuleKind::kFrameworkImport, false},
        {"import kivy", RuleKind::kFrameworkImport, false},
        {"import os", RuleKind::kDanger, false},
        {"import subprocess", RuleKind::kDanger, false},
        {"import sys", RuleKind::kDanger, false},
        {"__import__", RuleKind::kDanger, false},
        {"eval(", RuleKind::kDanger, false},
        {"exec(", RuleKind::kDanger, false},
        {"open(", RuleKind::kDanger, false},
        {"file(", RuleKind::kDanger, false},
        {"input(", RuleKind::kDanger, false},
        {"raw_input(", RuleKind::kDanger, false}
    };
}

const std::regex& WindowSizePattern() {
    static const std::regex pattern(
        R"(Window\s*\.\s*size\s*=\s*(\([^\)]*\)|\[[^\]]*\]))",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

const std::regex& ConfigDimensionPattern() {
    static const std::regex pattern(
        R"(Config\s*\.\s*set\s*\(\s*['"]graphics['"]\s*,\s*['"](width|height)['"]\s*,\s*['"]?(-?\d+)['"]?\s*\))",
        std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

std::optional<int> ToPositiveInt(const std::string& text) {
    try {
        const double value = std::stod(text);
        if (!std::isfinite(value) || value < 1.0 || value > 1000000.0) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<std::pair<int, int>> FirstTwoNumbers(const std::string& text) {
    static const std::regex number(R"(-?\d+(?:\.\d+)?)");
    std::vector<std::string> found;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), number);
         it != std::sregex_iterator() && found.size() < 2; ++it) {
        found.push_back(it->str());
    }
    if (found.size() < 2) {
        return std::nullopt;
    }
    const auto width = ToPositiveInt(found[0]);
    const auto height = ToPositiveInt(found[1]);
    if (!width || !height) {
        return std::nullopt;
    }
    return std::make_pair(*width, *height);
}

}  // namespace

CodeInspector::CodeInspector()
    : CodeInspector(true) {}

CodeInspector::CodeInspector(bool reject_dangerous_code)
    : reject_dangerous_code_(reject_dangerous_code)
    , rules_(BuildRuleTable()) {}

std::vector<std::string> CodeInspector::ExtractSnippets(const std::string& text) {
    std::vector<std::string> snippets;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto open = text.find(kFence, pos);
        if (open == std::string::npos) {
            break;
        }
        const auto tag_start = open + 3;
        const auto newline = text.find('\n', tag_start);
        if (newline == std::string::npos) {
            break;
        }
        const auto tag = utils::ToLower(text.substr(tag_start, newline - tag_start));
        if (tag != "py" && tag != "python") {
            pos = open + 1;
            continue;
        }
        const auto close = text.find(kFence, newline + 1);
        if (close == std::string::npos) {
            break;
        }
        auto body = utils::Trim(text.substr(newline + 1, close - newline - 1));
        if (!body.empty()) {
            snippets.push_back(std::move(body));
        }
        pos = close + 3;
    }
    return snippets;
}

bool CodeInspector::Matches(const InspectionRule& rule,
                            const std::string& snippet,
                            const std::string& lowered) const {
    const auto& haystack = rule.case_sensitive ? snippet : lowered;
    return haystack.find(rule.pattern) != std::string::npos;
}

bool CodeInspector::Classify(const std::string& snippet) const {
    const auto lowered = utils::ToLower(snippet);
    bool launches = false;
    bool imports = false;
    for (const auto& rule : rules_) {
        if (rule.kind == RuleKind::kLaunchCall && !launches) {
            launches = Matches(rule, snippet, lowered);
        } else if (rule.kind == RuleKind::kFrameworkImport && !imports) {
            imports = Matches(rule, snippet, lowered);
        }
    }
    return launches && imports;
}

DisplayHint CodeInspector::ParseDisplayHint(const std::string& snippet) {
    DisplayHint hint;
    std::smatch window;
    if (std::regex_search(snippet, window, WindowSizePattern())) {
        const auto pair = FirstTwoNumbers(window[1].str());
        if (pair) {
            hint.width = pair->first;
            hint.height = pair->second;
            hint.source = "window";
            return hint;
        }
    }

    // Each dimension keeps its last valid assignment.
    const auto& pattern = ConfigDimensionPattern();
    for (auto it = std::sregex_iterator(snippet.begin(), snippet.end(), pattern);
         it != std::sregex_iterator(); ++it) {
        const auto dimension = utils::ToLower((*it)[1].str());
        const auto value = ToPositiveInt((*it)[2].str());
        if (!value) {
            continue;
        }
        if (dimension == "width") {
            hint.width = value;
        } else {
            hint.height = value;
        }
    }
    if (hint.width || hint.height) {
        hint.source = "config";
    }
    return hint;
}

SafetyVerdict CodeInspector::CheckSafety(const std::string& snippet) const {
    SafetyVerdict verdict;
    if (!reject_dangerous_code_) {
        return verdict;
    }
    const auto lowered = utils::ToLower(snippet);
    for (const auto& rule : rules_) {
        if (rule.kind != RuleKind::kDanger) {
            continue;
        }
        if (Matches(rule, snippet, lowered)) {
            verdict.allowed = false;
            verdict.matched_pattern = rule.pattern;
            return verdict;
        }
    }
    return verdict;
}

std::optional<std::string> CodeInspector::SelectRenderable(const std::string& text) const {
    for (const auto& snippet : ExtractSnippets(text)) {
        if (Classify(snippet)) {
            return snippet;
        }
    }
    return std::nullopt;
}

}  // namespace kivybot::inspect
