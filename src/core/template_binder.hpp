#ifndef TEMPLATE_BINDER_HPP
#define TEMPLATE_BINDER_HPP

#include "frontmatter.hpp"
#include "template_engine.hpp"

#include <optional>
#include <string>
#include <vector>

// Merges a page's front matter with its rendered body and renders the
// "default" template with the result.
class TemplateBinder {
public:
  using json = nlohmann::json;

  static constexpr const char *template_name = "default";
  static constexpr const char *body_key = "body";

  explicit TemplateBinder(TemplateEngine &engine) : engine(engine) {}

  // Front matter entries plus "body". A front matter "body" is replaced by
  // `html` and reported as a warning.
  json build_variables(const std::string &html,
                       const std::optional<FrontMatter> &front_matter,
                       const fs::path &source = {});

  std::string bind(const std::string &html,
                   const std::optional<FrontMatter> &front_matter,
                   const fs::path &source = {});

  const std::vector<std::string> &warnings() const { return warnings_; }

private:
  TemplateEngine &engine;
  std::vector<std::string> warnings_;
};

#endif
