#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <vector>

#ifndef SYSCONFDIR
#define SYSCONFDIR "/etc"
#endif

namespace dockapp {

class Config {
 public:
  static const std::vector<std::string> CONFIG_DIRS;
  static const char *CONFIG_PATH_ENV;

  /* Try to find any of provided names in the supported set of config directories */
  static std::optional<std::string> findConfigPath(
      const std::vector<std::string> &names, const std::vector<std::string> &dirs = CONFIG_DIRS);

  static std::vector<std::string> tryExpandPath(const std::string &base,
                                                const std::string &filename);

  Config() = default;

  /*
   * Loads `config`, or `<app>.json` / `<app>.jsonc` from the config directories when `config` is
   * empty. Without a config file every option keeps its default.
   */
  void load(const std::string &config, const std::string &app);

  // Values set in `overrides` replace those read from the file.
  void applyOverrides(const Json::Value &overrides);

  Json::Value &getConfig() { return config_; }
  const std::string &path() const { return config_file_; }

 private:
  void setupConfig(Json::Value &dst, const std::string &config_file, int depth);
  void resolveConfigIncludes(Json::Value &config, int depth);
  void mergeConfig(Json::Value &a_config_, Json::Value &b_config_);

  std::string config_file_;

  Json::Value config_{Json::objectValue};
};
}  // namespace dockapp
