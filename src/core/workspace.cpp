#include "workspace.hpp"
#include "default_templates.hpp"
#include "errors.hpp"
#include "utils/console.hpp"

#include <fstream>
#include <system_error>

// True when `path` is `dir` itself or lies somewhere below it.
static bool is_within(const fs::path &path, const fs::path &dir) {
  std::error_code ec;
  fs::path p = fs::weakly_canonical(path, ec);
  if (ec)
    p = fs::absolute(path).lexically_normal();
  fs::path d = fs::weakly_canonical(dir, ec);
  if (ec)
    d = fs::absolute(dir).lexically_normal();

  fs::path relative = p.lexically_relative(d);
  return !relative.empty() && *relative.begin() != "..";
}

Workspace::Workspace(fs::path input_dir, fs::path output_dir,
                     fs::path templates_dir, std::string template_ext)
    : input_dir_(std::move(input_dir)), output_dir_(std::move(output_dir)),
      templates_dir_(std::move(templates_dir)),
      template_ext_(std::move(template_ext)) {}

Workspace Workspace::from_config(const ScribeConfig &config,
                                 const fs::path &project_root) {
  return Workspace(project_root / config.input_dir,
                   project_root / config.output_dir,
                   project_root / config.templates_dir, config.template_ext);
}

void Workspace::create_parent_dirs(const fs::path &path) {
  if (!path.has_parent_path()) {
    return;
  }
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);
  if (ec) {
    throw OutputError("cannot create directory " +
                          path.parent_path().string() + ": " + ec.message(),
                      path);
  }
}

void Workspace::ensure_input() const {
  std::error_code ec;
  fs::create_directories(input_dir_, ec);
  if (ec) {
    throw DocumentReadError("cannot create input directory: " + ec.message(),
                            input_dir_);
  }
}

bool Workspace::ensure_templates() const {
  if (fs::exists(templates_dir_)) {
    return false;
  }

  console::section("Inflating default templates");
  for (const auto &file : default_templates(template_ext_)) {
    fs::path target = templates_dir_ / file.relative_path;
    create_parent_dirs(target);

    std::ofstream out(target, std::ios::binary);
    if (!out.is_open()) {
      throw OutputError("cannot write template", target);
    }
    out << file.content;
    if (!out) {
      throw OutputError("write failed", target);
    }
    console::step("template", target.string());
  }
  return true;
}

void Workspace::prepare_output() const {
  if (is_within(input_dir_, output_dir_) ||
      is_within(templates_dir_, output_dir_)) {
    throw OutputError("refusing to clear an output directory that contains "
                      "the input or template directory",
                      output_dir_);
  }

  std::error_code ec;
  if (fs::exists(output_dir_)) {
    fs::remove_all(output_dir_, ec);
    if (ec) {
      throw OutputError("cannot clear output directory: " + ec.message(),
                        output_dir_);
    }
  }
  fs::create_directories(output_dir_, ec);
  if (ec) {
    throw OutputError("cannot create output directory: " + ec.message(),
                      output_dir_);
  }

  copy_template_assets();
}

void Workspace::copy_template_assets() const {
  if (!fs::exists(templates_dir_)) {
    return;
  }

  const std::string template_suffix = "." + template_ext_;
  std::error_code ec;
  fs::recursive_directory_iterator it(
      templates_dir_, fs::directory_options::follow_directory_symlink, ec);
  if (ec) {
    throw OutputError("cannot read template directory: " + ec.message(),
                      templates_dir_);
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw OutputError("cannot read template directory: " + ec.message(),
                        templates_dir_);
    }

    const fs::path &source = it->path();
    bool directory = it->is_directory();
    if (source.filename().string().front() == '.') {
      if (directory) {
        it.disable_recursion_pending();
      }
      continue;
    }

    fs::path target = output_dir_ / fs::relative(source, templates_dir_);
    if (directory) {
      fs::create_directories(target, ec);
    } else if (source.extension() == template_suffix) {
      continue;
    } else {
      create_parent_dirs(target);
      fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
      if (!ec) {
        console::step("asset", target.string());
      }
    }

    if (ec) {
      throw OutputError("failed to copy " + source.string() + ": " +
                            ec.message(),
                        target);
    }
  }
}
