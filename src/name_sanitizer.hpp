#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "log.hpp"
#include "run_configuration.hpp"

// Applies rules in order, each one to the output of the previous one.
// A rule that fails (bad regex, bad template) is logged and leaves the name
// as it was before that rule; the remaining rules still run.
std::string sanitize_name(const std::string& name,
                          const std::vector<SanitizationRule>& rules,
                          Logger* logger = nullptr);

// Replaces every non-overlapping occurrence of pattern, scanning left to right.
std::string replace_all_literal(const std::string& input,
                                const std::string& pattern,
                                const std::string& replacement);

constexpr std::size_t kMaxGroupReference = 99;

// Converts a rule-file replacement template (\1, \g<1>, \g<0>, \\) into the
// ECMAScript format understood by std::regex_replace.
// Throws std::invalid_argument for named groups, for \0 (an octal escape,
// not a group) and for references above group_count.
std::string to_ecmascript_template(const std::string& replacement,
                                   std::size_t group_count = kMaxGroupReference);
