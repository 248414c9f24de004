#include "template_binder.hpp"
#include "utils/console.hpp"

TemplateBinder::json
TemplateBinder::build_variables(const std::string &html,
                                const std::optional<FrontMatter> &front_matter,
                                const fs::path &source) {
  json vars = json::object();
  if (front_matter) {
    for (const auto &[key, value] : front_matter->data) {
      vars[key] = value;
    }
  }

  if (vars.contains(body_key)) {
    std::string warning = "front matter variable 'body' will be ignored";
    if (!source.empty()) {
      warning += " in " + source.string();
    }
    warnings_.push_back(warning);
    console::warn(warning);
  }
  vars[body_key] = html;

  return vars;
}

std::string TemplateBinder::bind(const std::string &html,
                                 const std::optional<FrontMatter> &front_matter,
                                 const fs::path &source) {
  return engine.render(template_name,
                       build_variables(html, front_matter, source));
}
