#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <vector>

// Process-wide KEY=VALUE settings loaded from a .env-style file.
class ConfigManager {
public:
  // Clears previous settings. A missing file leaves the store empty (warned).
  static void Initialize(const std::string& env_path = ".env");
  // Overrides or adds one setting (used by callers that assemble config in code).
  static void Set(const std::string& key, const std::string& value);
  static std::optional<std::string> Get(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static unsigned long long GetUint64Or(const std::string& key, unsigned long long default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Comma separated list; blank items dropped.
  static std::vector<std::string> GetList(const std::string& key);
private:
  static std::unordered_map<std::string, std::string> cache_;
  static void LoadEnvFile(const std::string& env_path);
};
