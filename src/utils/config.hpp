#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "core/errors.hpp"
#include "utils/console.hpp"
#include <filesystem>
#include <string>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class ScribeConfig {
private:
  static void read_string(const YAML::Node &yaml, const char *key,
                          std::string &target, const fs::path &config_path) {
    if (!yaml[key]) {
      return;
    }
    if (!yaml[key].IsScalar()) {
      throw ConfigError(std::string("'") + key + "' must be a string",
                        config_path);
    }
    target = yaml[key].as<std::string>();
  }

public:
  std::string input_dir = "markdown";
  std::string output_dir = "_website";
  std::string templates_dir = "templates";
  std::string template_ext = "tmpl";

  std::string book_file = "book.epub";
  std::string title = "My Book";
  std::string author = "Author Name";
  std::string language = "en";

  static constexpr const char *default_file = "scribe.yaml";

  static ScribeConfig load(const fs::path &config_path) {
    ScribeConfig config;

    if (!fs::exists(config_path)) {
      throw ConfigError("config file not found", config_path);
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw ConfigError("YAML parsing error: " + std::string(e.what()),
                        config_path);
    }

    if (yaml.IsNull()) {
      return config;
    }
    if (!yaml.IsMap()) {
      throw ConfigError("config must be a YAML map", config_path);
    }

    std::unordered_set<std::string> known_keys = {
        "input_dir", "output_dir", "templates_dir", "template_ext",
        "book_file", "title",      "author",        "language"};

    for (auto it = yaml.begin(); it != yaml.end(); ++it) {
      std::string key = it->first.Scalar();
      if (known_keys.find(key) == known_keys.end()) {
        console::warn("unknown config key '" + key + "' in " +
                      config_path.string());
      }
    }

    read_string(yaml, "input_dir", config.input_dir, config_path);
    read_string(yaml, "output_dir", config.output_dir, config_path);
    read_string(yaml, "templates_dir", config.templates_dir, config_path);
    read_string(yaml, "template_ext", config.template_ext, config_path);
    read_string(yaml, "book_file", config.book_file, config_path);
    read_string(yaml, "title", config.title, config_path);
    read_string(yaml, "author", config.author, config_path);
    read_string(yaml, "language", config.language, config_path);

    if (!config.template_ext.empty() && config.template_ext[0] == '.') {
      config.template_ext.erase(0, 1);
    }
    if (config.template_ext.empty()) {
      throw ConfigError("'template_ext' must not be empty", config_path);
    }

    return config;
  }

  // Defaults when the file does not exist.
  static ScribeConfig load_if_present(const fs::path &config_path) {
    if (!fs::exists(config_path)) {
      return ScribeConfig();
    }
    return load(config_path);
  }
};

#endif
