#include "template_engine.hpp"
#include "errors.hpp"

#include <fstream>
#include <sstream>

static std::string read_template(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw TemplateRenderError("cannot open template", path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

TemplateEngine::TemplateEngine() {
  // Every template is registered explicitly, includes resolve by name.
  env.set_search_included_templates_in_files(false);
}

void TemplateEngine::load_directory(const fs::path &dir,
                                    const std::string &extension) {
  const std::string suffix = "." + extension;

  std::error_code ec;
  fs::recursive_directory_iterator it(
      dir, fs::directory_options::follow_directory_symlink, ec);
  if (ec) {
    throw TemplateRenderError("cannot read template directory: " +
                                  ec.message(),
                              dir);
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw TemplateRenderError("cannot read template directory: " +
                                    ec.message(),
                                dir);
    }

    const fs::path &path = it->path();
    if (path.filename().string().front() == '.') {
      if (it->is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file() || path.extension() != suffix) {
      continue;
    }

    fs::path relative = fs::relative(path, dir);
    relative.replace_extension();

    try {
      add_template(relative.generic_string(), read_template(path));
    } catch (TemplateRenderError &e) {
      e.attach_path(path);
      throw;
    }
  }
}

void TemplateEngine::add_template(const std::string &name,
                                  const std::string &source) {
  try {
    inja::Template tmpl = env.parse(source);
    env.include_template(name, tmpl);
    templates[name] = tmpl;
  } catch (const inja::InjaError &e) {
    throw TemplateRenderError("template '" + name + "': " + e.what());
  } catch (const json::exception &e) {
    throw TemplateRenderError("template '" + name + "': " + e.what());
  }
}

bool TemplateEngine::has_template(const std::string &name) const {
  return templates.find(name) != templates.end();
}

std::vector<std::string> TemplateEngine::template_names() const {
  std::vector<std::string> names;
  for (const auto &[name, tmpl] : templates) {
    names.push_back(name);
  }
  return names;
}

std::string TemplateEngine::render(const std::string &name, const json &data) {
  auto it = templates.find(name);
  if (it == templates.end()) {
    throw TemplateRenderError("template '" + name + "' not found");
  }

  try {
    return env.render(it->second, data);
  } catch (const inja::InjaError &e) {
    throw TemplateRenderError("template '" + name + "': " + e.what());
  } catch (const json::exception &e) {
    // Type errors while evaluating expressions, e.g. arithmetic on strings.
    throw TemplateRenderError("template '" + name + "': " + e.what());
  }
}
