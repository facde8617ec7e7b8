#pragma once

#include "errors.hpp"
#include "sway/window_record.hpp"

#include <expected>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

enum class PatternType { Class, Instance, Title };
enum class Scope { Scoped, Global };
enum class RuleSource { System, User };

struct ClassificationRule {
    std::string pattern;  // case-insensitive regular expression, searched anywhere in the field
    PatternType type = PatternType::Class;
    Scope scope = Scope::Global;
    int priority = 0;     // 0..100
    RuleSource source = RuleSource::User;
};

// Load-time check so a bad rule is rejected before it can reach a sweep.
std::expected<void, Error> validate_rule(const ClassificationRule& rule);

class WindowClassifier {
public:
    WindowClassifier() = default;
    // Rules that fail validate_rule() are dropped.
    explicit WindowClassifier(const std::vector<ClassificationRule>& rules);

    // First match by priority descending, system before user on ties,
    // then load order. No match means Global.
    Scope classify(const WindowRecord& window) const;

    // The rule that decided classify(), if any.
    const ClassificationRule* match(const WindowRecord& window) const;

    size_t size() const { return rules_.size(); }

private:
    struct CompiledRule {
        ClassificationRule rule;
        std::regex regex;
    };

    static const std::string& field(const WindowRecord& window, PatternType type);

    std::vector<CompiledRule> rules_;
};

const char* to_string(PatternType type);
const char* to_string(Scope scope);
const char* to_string(RuleSource source);

std::optional<PatternType> pattern_type_from_string(std::string_view s);
std::optional<Scope> scope_from_string(std::string_view s);
std::optional<RuleSource> rule_source_from_string(std::string_view s);
