#ifndef WORKSPACE_HPP
#define WORKSPACE_HPP

#include "utils/config.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// The directories a run works with. The output root belongs to the run:
// prepare_output() is the one place it gets wiped and repopulated.
class Workspace {
public:
  Workspace(fs::path input_dir, fs::path output_dir, fs::path templates_dir,
            std::string template_ext);

  static Workspace from_config(const ScribeConfig &config,
                               const fs::path &project_root);

  const fs::path &input_dir() const { return input_dir_; }
  const fs::path &output_dir() const { return output_dir_; }
  const fs::path &templates_dir() const { return templates_dir_; }
  const std::string &template_ext() const { return template_ext_; }

  // Creates the input directory when missing.
  void ensure_input() const;

  // Creates and fills the template directory with the built-in templates
  // when it does not exist. Returns true when it did so.
  bool ensure_templates() const;

  // Removes the output directory with everything in it, recreates it and
  // copies the template directory's support files (everything except
  // template sources and hidden entries) into it.
  void prepare_output() const;

  static void create_parent_dirs(const fs::path &path);

private:
  void copy_template_assets() const;

  fs::path input_dir_;
  fs::path output_dir_;
  fs::path templates_dir_;
  std::string template_ext_;
};

#endif
