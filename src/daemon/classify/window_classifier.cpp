#include "window_classifier.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

constexpr auto REGEX_FLAGS = std::regex::ECMAScript | std::regex::icase;

} // namespace

std::expected<void, Error> validate_rule(const ClassificationRule& rule) {
    if (rule.pattern.empty()) {
        return std::unexpected(Error{ErrorKind::Configuration, "rule pattern is empty"});
    }
    if (rule.priority < 0 || rule.priority > 100) {
        return std::unexpected(Error{ErrorKind::Configuration,
                                     std::format("rule priority {} outside 0..100", rule.priority)});
    }
    try {
        std::regex re(rule.pattern, REGEX_FLAGS);
    } catch (const std::regex_error& e) {
        return std::unexpected(Error{ErrorKind::Configuration,
                                     std::format("invalid pattern '{}': {}", rule.pattern, e.what())});
    }
    return {};
}

WindowClassifier::WindowClassifier(const std::vector<ClassificationRule>& rules) {
    for (const auto& rule : rules) {
        if (auto ok = validate_rule(rule); !ok) {
            std::println(stderr, "config: dropping rule: {}", ok.error().message);
            continue;
        }
        rules_.push_back({rule, std::regex(rule.pattern, REGEX_FLAGS)});
    }

    std::ranges::stable_sort(rules_, [](const CompiledRule& a, const CompiledRule& b) {
        if (a.rule.priority != b.rule.priority) return a.rule.priority > b.rule.priority;
        return a.rule.source == RuleSource::System && b.rule.source == RuleSource::User;
    });
}

Scope WindowClassifier::classify(const WindowRecord& window) const {
    const auto* rule = match(window);
    return rule ? rule->scope : Scope::Global;
}

const ClassificationRule* WindowClassifier::match(const WindowRecord& window) const {
    for (const auto& r : rules_) {
        if (std::regex_search(field(window, r.rule.type), r.regex)) return &r.rule;
    }
    return nullptr;
}

const std::string& WindowClassifier::field(const WindowRecord& window, PatternType type) {
    switch (type) {
        case PatternType::Class: return window.window_class;
        case PatternType::Instance: return window.instance;
        case PatternType::Title: return window.title;
    }
    return window.window_class;
}

const char* to_string(PatternType type) {
    switch (type) {
        case PatternType::Class: return "class";
        case PatternType::Instance: return "instance";
        case PatternType::Title: return "title";
    }
    return "class";
}

const char* to_string(Scope scope) {
    return scope == Scope::Scoped ? "scoped" : "global";
}

const char* to_string(RuleSource source) {
    return source == RuleSource::System ? "system" : "user";
}

std::optional<PatternType> pattern_type_from_string(std::string_view s) {
    if (s == "class") return PatternType::Class;
    if (s == "instance") return PatternType::Instance;
    if (s == "title") return PatternType::Title;
    return std::nullopt;
}

std::optional<Scope> scope_from_string(std::string_view s) {
    if (s == "scoped") return Scope::Scoped;
    if (s == "global") return Scope::Global;
    return std::nullopt;
}

std::optional<RuleSource> rule_source_from_string(std::string_view s) {
    if (s == "system") return RuleSource::System;
    if (s == "user") return RuleSource::User;
    return std::nullopt;
}
