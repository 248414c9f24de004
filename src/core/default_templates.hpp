#ifndef DEFAULT_TEMPLATES_HPP
#define DEFAULT_TEMPLATES_HPP

#include <string>
#include <vector>

struct EmbeddedFile {
  std::string relative_path;
  std::string content;
};

// Files written into a template directory that does not exist yet. Template
// sources use `template_ext` as their extension.
std::vector<EmbeddedFile> default_templates(const std::string &template_ext);

#endif
