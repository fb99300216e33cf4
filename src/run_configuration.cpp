#include "run_configuration.hpp"

#include <fstream>
#include <stdexcept>

#include "settings_manager.hpp"
#include "utils.hpp"

std::optional<TransferAction> parse_transfer_action(const std::string& value) {
  auto lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  if(lowered == "copy") return TransferAction::Copy;
  if(lowered == "move") return TransferAction::Move;
  return std::nullopt;
}

const char* transfer_action_name(TransferAction action) {
  switch(action) {
    case TransferAction::Copy: return "copy";
    case TransferAction::Move: return "move";
  }
  return "unknown";
}

namespace {

std::string string_field(const nlohmann::json& entry, const char* key) {
  if(!entry.contains(key)) return "";
  const auto& value = entry.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_null()) return "";
  return value.dump();
}

bool bool_field(const nlohmann::json& entry) {
  for(const char* key : {"is_regex", "isRegex"}) {
    if(!entry.contains(key)) continue;
    const auto& value = entry.at(key);
    if(value.is_boolean()) return value.get<bool>();
    if(value.is_number_integer()) return value.get<int>() != 0;
    throw std::runtime_error(std::string("rule field '") + key + "' must be a boolean");
  }
  return false;
}

} // namespace

std::vector<SanitizationRule> rules_from_json(const nlohmann::json& doc) {
  if(!doc.is_array()) {
    throw std::runtime_error("rule file must contain a JSON array");
  }
  std::vector<SanitizationRule> rules;
  rules.reserve(doc.size());
  for(std::size_t i = 0; i < doc.size(); ++i) {
    const auto& entry = doc.at(i);
    if(!entry.is_object()) {
      throw std::runtime_error("rule #" + std::to_string(i) + " is not an object");
    }
    SanitizationRule rule;
    rule.pattern = string_field(entry, "pattern");
    rule.replacement = string_field(entry, "replacement");
    rule.is_regex = bool_field(entry);
    rules.push_back(std::move(rule));
  }
  return rules;
}

std::vector<SanitizationRule> load_rules_file(const std::filesystem::path& path) {
  std::error_code ec;
  if(!std::filesystem::is_regular_file(path, ec)) {
    throw std::runtime_error("Sanitization rules file not found: " + path.string());
  }
  std::ifstream in(path);
  if(!in) {
    throw std::runtime_error("Unable to open rules file: " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw std::runtime_error("Error loading rules file '" + path.string() + "': " + e.what());
  }
  return rules_from_json(doc);
}

RunConfiguration run_configuration_from_settings(const SettingsManager& settings) {
  RunConfiguration config;
  auto action = parse_transfer_action(settings.get<std::string>("action"));
  if(!action) {
    throw std::runtime_error("Invalid action '" + settings.get<std::string>("action") + "' (expected copy or move)");
  }
  config.action = *action;
  config.verify_hash = settings.get<bool>("verify");
  config.separator = settings.get<std::string>("separator");

  int workers = settings.get<int>("workers");
  config.worker_count = workers > 0 ? static_cast<std::size_t>(workers) : default_worker_count();

  auto rules_path = settings.get<std::string>("rules");
  if(!rules_path.empty()) {
    config.rules = load_rules_file(rules_path);
  }
  return config;
}
