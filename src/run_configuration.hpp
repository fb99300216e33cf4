#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class SettingsManager;

enum class TransferAction { Copy, Move };

std::optional<TransferAction> parse_transfer_action(const std::string& value);
const char* transfer_action_name(TransferAction action);

struct SanitizationRule {
  std::string pattern;
  std::string replacement;
  bool is_regex = false;
};

// Built once before a run and only read afterwards, including from worker threads.
struct RunConfiguration {
  TransferAction action = TransferAction::Copy;
  bool verify_hash = false;
  std::string separator = "++";
  std::size_t worker_count = 1;
  std::vector<SanitizationRule> rules;
};

// Accepts "is_regex" or "isRegex"; missing fields default to empty / false.
// Throws std::runtime_error when the document is not an array of objects.
std::vector<SanitizationRule> rules_from_json(const nlohmann::json& doc);
std::vector<SanitizationRule> load_rules_file(const std::filesystem::path& path);

// Reads action, separator, verify, workers and the rule file named by
// "rules". Throws std::runtime_error for an invalid action or rule file.
RunConfiguration run_configuration_from_settings(const SettingsManager& settings);
