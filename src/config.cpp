#include "config.hpp"

#include <fmt/ostream.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <wordexp.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

#if (FMT_VERSION >= 90000)

template <>
struct fmt::formatter<Json::Value> : ostream_formatter {};

#endif

namespace fs = std::filesystem;

namespace dockapp {

namespace {

Json::Value parseJson(const std::string &str) {
  // JSON has no "\x" escape; accept it as "\u00".
  static const std::regex hex_escape("\\\\x");
  std::istringstream stream(std::regex_replace(str, hex_escape, "\\u00"));

  Json::CharReaderBuilder builder;
  Json::Value root;
  std::string errs;
  if (!Json::parseFromStream(builder, stream, &root, &errs)) {
    throw std::runtime_error("Error parsing JSON: " + errs);
  }
  return root;
}

}  // namespace

const std::vector<std::string> Config::CONFIG_DIRS = {
    "$XDG_CONFIG_HOME/dockapp/",
    "$HOME/.config/dockapp/",
    "/etc/xdg/dockapp/",
    SYSCONFDIR "/xdg/dockapp/",
};

const char *Config::CONFIG_PATH_ENV = "DOCKAPP_CONFIG_DIR";

std::vector<std::string> Config::tryExpandPath(const std::string &base,
                                               const std::string &filename) {
  fs::path path;

  if (!filename.empty()) {
    path = fs::path(base) / fs::path(filename);
  } else {
    path = fs::path(base);
  }

  spdlog::debug("Try expanding: {}", path.string());

  std::vector<std::string> results;
  wordexp_t p;
  if (wordexp(path.c_str(), &p, 0) == 0) {
    for (size_t i = 0; i < p.we_wordc; i++) {
      if (access(p.we_wordv[i], F_OK) == 0) {
        results.emplace_back(p.we_wordv[i]);
        spdlog::debug("Found config file: {}", p.we_wordv[i]);
      }
    }
    wordfree(&p);
  }

  return results;
}

std::optional<std::string> Config::findConfigPath(const std::vector<std::string> &names,
                                                  const std::vector<std::string> &dirs) {
  if (const char *dir = std::getenv(Config::CONFIG_PATH_ENV)) {
    for (const auto &name : names) {
      if (auto res = tryExpandPath(dir, name); !res.empty()) {
        return res.front();
      }
    }
  }

  for (const auto &dir : dirs) {
    for (const auto &name : names) {
      if (auto res = tryExpandPath(dir, name); !res.empty()) {
        return res.front();
      }
    }
  }
  return std::nullopt;
}

void Config::setupConfig(Json::Value &dst, const std::string &config_file, int depth) {
  if (depth > 100) {
    throw std::runtime_error("Aborting due to likely recursive include in config files");
  }
  std::ifstream file(config_file);
  if (!file.is_open()) {
    throw std::runtime_error("Can't open config file " + config_file);
  }
  std::string str((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  Json::Value tmp_config = parseJson(str);
  if (!tmp_config.isObject()) {
    throw std::runtime_error(config_file + ": configuration must be a JSON object");
  }
  resolveConfigIncludes(tmp_config, depth);
  mergeConfig(dst, tmp_config);
}

void Config::resolveConfigIncludes(Json::Value &config, int depth) {
  Json::Value includes = config["include"];
  config.removeMember("include");
  if (includes.isArray()) {
    for (const auto &include : includes) {
      spdlog::info("Including resource file: {}", include.asString());
      for (const auto &match : tryExpandPath(include.asString(), "")) {
        setupConfig(config, match, depth + 1);
      }
    }
  } else if (includes.isString()) {
    spdlog::info("Including resource file: {}", includes.asString());
    for (const auto &match : tryExpandPath(includes.asString(), "")) {
      setupConfig(config, match, depth + 1);
    }
  }
}

void Config::mergeConfig(Json::Value &a_config_, Json::Value &b_config_) {
  if (!a_config_ || (a_config_.isObject() && a_config_.empty())) {
    // For the first config
    a_config_ = b_config_;
  } else if (a_config_.isObject() && b_config_.isObject()) {
    for (const auto &key : b_config_.getMemberNames()) {
      // [] creates key with default value. Use `get` to avoid that.
      if (a_config_.get(key, Json::Value::nullSingleton()).isObject() &&
          b_config_[key].isObject()) {
        mergeConfig(a_config_[key], b_config_[key]);
      } else if (!a_config_.isMember(key)) {
        // do not allow overriding value set by top or previously included config
        a_config_[key] = b_config_[key];
      } else {
        spdlog::trace("Option {} is already set; ignoring value {}", key, b_config_[key]);
      }
    }
  } else {
    spdlog::error("Cannot merge config, conflicting or invalid JSON types");
  }
}

void Config::load(const std::string &config, const std::string &app) {
  config_ = Json::Value(Json::objectValue);
  config_file_.clear();

  auto file = config.empty() ? findConfigPath({app + ".json", app + ".jsonc"})
                             : std::optional<std::string>(config);
  if (!file) {
    spdlog::info("No configuration file for {}, using defaults", app);
    return;
  }
  config_file_ = file.value();
  spdlog::info("Using configuration file {}", config_file_);
  setupConfig(config_, config_file_, 0);
}

void Config::applyOverrides(const Json::Value &overrides) {
  if (!overrides.isObject()) {
    return;
  }
  for (const auto &key : overrides.getMemberNames()) {
    spdlog::debug("Option {} set on the command line: {}", key, overrides[key]);
    config_[key] = overrides[key];
  }
}

}  // namespace dockapp
