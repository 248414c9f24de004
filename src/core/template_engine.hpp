#ifndef TEMPLATE_ENGINE_HPP
#define TEMPLATE_ENGINE_HPP

#include <filesystem>
#include <inja/inja.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Named inja templates. Output is never HTML-escaped, so pre-rendered HTML
// passed in as data is inserted verbatim.
class TemplateEngine {
public:
  using json = nlohmann::json;

  TemplateEngine();

  // Registers every non-hidden file ending in `.<extension>` under `dir`,
  // named by its relative path without the extension ("default.tmpl" ->
  // "default"). Throws TemplateRenderError on a syntax error.
  void load_directory(const fs::path &dir, const std::string &extension);

  void add_template(const std::string &name, const std::string &source);

  bool has_template(const std::string &name) const;
  std::vector<std::string> template_names() const;

  // Throws TemplateRenderError when the template is unknown or rendering
  // fails (e.g. a variable the template uses is missing from `data`).
  std::string render(const std::string &name, const json &data);

private:
  inja::Environment env;
  std::map<std::string, inja::Template> templates;
};

#endif
