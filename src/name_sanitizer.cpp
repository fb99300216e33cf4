#include "name_sanitizer.hpp"

#include <cctype>
#include <regex>
#include <stdexcept>

namespace {

bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void append_group_reference(std::string& out, std::size_t group, std::size_t group_count) {
  if(group > group_count) {
    throw std::invalid_argument("invalid group reference " + std::to_string(group));
  }
  if(group == 0) {
    out += "$&";
    return;
  }
  // Two digits so a following literal digit is never read as part of the group.
  out += '$';
  out += static_cast<char>('0' + group / 10);
  out += static_cast<char>('0' + group % 10);
}

std::string apply_rule(const std::string& input, const SanitizationRule& rule) {
  if(rule.is_regex) {
    std::regex pattern(rule.pattern);
    return std::regex_replace(input, pattern, to_ecmascript_template(rule.replacement, pattern.mark_count()));
  }
  return replace_all_literal(input, rule.pattern, rule.replacement);
}

} // namespace

std::string replace_all_literal(const std::string& input,
                                const std::string& pattern,
                                const std::string& replacement) {
  if(pattern.empty()) return input;
  std::string out;
  out.reserve(input.size());
  std::size_t pos = 0;
  while(true) {
    auto hit = input.find(pattern, pos);
    if(hit == std::string::npos) break;
    out.append(input, pos, hit - pos);
    out += replacement;
    pos = hit + pattern.size();
  }
  out.append(input, pos, std::string::npos);
  return out;
}

std::string to_ecmascript_template(const std::string& replacement, std::size_t group_count) {
  std::string out;
  out.reserve(replacement.size());
  for(std::size_t i = 0; i < replacement.size(); ++i) {
    char c = replacement[i];
    if(c == '$') {
      out += "$$";
      continue;
    }
    if(c != '\\' || i + 1 >= replacement.size()) {
      out += c;
      continue;
    }
    char next = replacement[i + 1];
    if(next == '0') {
      throw std::invalid_argument("octal escapes are not supported in replacement '" + replacement + "'");
    }
    if(is_digit(next)) {
      std::size_t group = static_cast<std::size_t>(next - '0');
      ++i;
      if(i + 1 < replacement.size() && is_digit(replacement[i + 1])) {
        group = group * 10 + static_cast<std::size_t>(replacement[i + 1] - '0');
        ++i;
      }
      append_group_reference(out, group, group_count);
    } else if(next == 'g' && i + 2 < replacement.size() && replacement[i + 2] == '<') {
      auto close = replacement.find('>', i + 3);
      if(close == std::string::npos) {
        throw std::invalid_argument("unterminated group reference in '" + replacement + "'");
      }
      std::string name = replacement.substr(i + 3, close - (i + 3));
      if(name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("named group references are not supported: \\g<" + name + ">");
      }
      if(name.size() > 2) {
        throw std::invalid_argument("invalid group reference " + name);
      }
      append_group_reference(out, static_cast<std::size_t>(std::stoi(name)), group_count);
      i = close;
    } else if(next == '\\') {
      out += '\\';
      ++i;
    } else if(next == 'n') {
      out += '\n';
      ++i;
    } else if(next == 't') {
      out += '\t';
      ++i;
    } else {
      out += c;
    }
  }
  return out;
}

std::string sanitize_name(const std::string& name,
                          const std::vector<SanitizationRule>& rules,
                          Logger* logger) {
  log_debug(logger, "Sanitizing name: '{}'", name);
  if(rules.empty()) {
    log_debug(logger, "No sanitization rules loaded.");
    return name;
  }

  std::string output = name;
  for(const auto& rule : rules) {
    if(rule.pattern.empty()) continue;
    std::string before = output;
    try {
      output = apply_rule(output, rule);
    } catch(const std::regex_error& e) {
      log_error(logger, "Regex error in rule pattern '{}': {}", rule.pattern, e.what());
      continue;
    } catch(const std::exception& e) {
      log_error(logger, "Error applying rule '{}': {}", rule.pattern, e.what());
      continue;
    }
    if(before != output) {
      log_verbose(logger, "Rule applied: pattern='{}' replacement='{}': '{}' -> '{}'",
                  rule.pattern, rule.replacement, before, output);
    }
  }
  return output;
}
