#include "core/book_builder.hpp"
#include "core/document_scanner.hpp"
#include "core/errors.hpp"
#include "core/site_builder.hpp"
#include "core/template_engine.hpp"
#include "core/workspace.hpp"
#include "utils/build_info.hpp"
#include "utils/config.hpp"
#include "utils/console.hpp"
#include <filesystem>
#include <iostream>
#include <optional>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "Scribe - Markdown to website and eBook converter\n\n";
  std::cout << "Commands:\n";
  std::cout << "  scribe web  [options]     Build the website\n";
  std::cout << "  scribe book [options]     Build the eBook (EPUB)\n";
  std::cout << "  scribe --version          Show version\n";
  std::cout << "  scribe --help             Show this help\n\n";
  std::cout << "Options:\n";
  std::cout << "  -i, --input DIR           Input directory (default: "
               "markdown)\n";
  std::cout << "  -o, --output DIR          Output directory (default: "
               "_website)\n";
  std::cout << "  -t, --templates DIR       Template directory (default: "
               "templates)\n";
  std::cout << "  -c, --config FILE         Config file (default: "
               "scribe.yaml if present)\n";
  std::cout << "      --title TEXT          Book title\n";
  std::cout << "      --author TEXT         Book author\n";
  std::cout << "      --book-file FILE      Book output file (default: "
               "book.epub)\n";
  std::cout << "  -q, --quiet               Only print warnings, errors and "
               "the summary\n";
}

struct Options {
  std::optional<std::string> input_dir;
  std::optional<std::string> output_dir;
  std::optional<std::string> templates_dir;
  std::optional<std::string> config_file;
  std::optional<std::string> title;
  std::optional<std::string> author;
  std::optional<std::string> book_file;
  bool quiet = false;
};

// Returns nullopt after reporting a usage error.
std::optional<Options> parse_options(int argc, char *argv[]) {
  Options options;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-q" || arg == "--quiet") {
      options.quiet = true;
      continue;
    }

    std::optional<std::string> *target = nullptr;
    if (arg == "-i" || arg == "--input") {
      target = &options.input_dir;
    } else if (arg == "-o" || arg == "--output") {
      target = &options.output_dir;
    } else if (arg == "-t" || arg == "--templates") {
      target = &options.templates_dir;
    } else if (arg == "-c" || arg == "--config") {
      target = &options.config_file;
    } else if (arg == "--title") {
      target = &options.title;
    } else if (arg == "--author") {
      target = &options.author;
    } else if (arg == "--book-file") {
      target = &options.book_file;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return std::nullopt;
    }

    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << std::endl;
      return std::nullopt;
    }
    *target = argv[++i];
  }

  return options;
}

ScribeConfig resolve_config(const Options &options,
                            const fs::path &project_root) {
  ScribeConfig config =
      options.config_file
          ? ScribeConfig::load(*options.config_file)
          : ScribeConfig::load_if_present(project_root /
                                          ScribeConfig::default_file);

  if (options.input_dir)
    config.input_dir = *options.input_dir;
  if (options.output_dir)
    config.output_dir = *options.output_dir;
  if (options.templates_dir)
    config.templates_dir = *options.templates_dir;
  if (options.title)
    config.title = *options.title;
  if (options.author)
    config.author = *options.author;
  if (options.book_file)
    config.book_file = *options.book_file;

  return config;
}

void report_error(const ScribeError &e) {
  std::string message = ScribeError::kind_name(e.kind());
  if (!e.path().empty()) {
    message += " in " + e.path().string();
  }
  message += ": " + e.message();
  console::error(message);
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  fs::path project_root = fs::current_path();

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }
  if (command == "--version" || command == "-v") {
    std::cout << BuildInfo::getInstance().describe() << std::endl;
    return 0;
  }
  if (command != "web" && command != "book") {
    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
  }

  std::optional<Options> options = parse_options(argc, argv);
  if (!options) {
    print_usage();
    return 1;
  }
  console::set_quiet(options->quiet);

  try {
    ScribeConfig config = resolve_config(*options, project_root);
    Workspace workspace = Workspace::from_config(config, project_root);

    workspace.ensure_input();
    workspace.ensure_templates();

    std::vector<Document> documents = scan_documents(workspace.input_dir());

    size_t count = 0;
    if (command == "web") {
      TemplateEngine engine;
      engine.load_directory(workspace.templates_dir(),
                            workspace.template_ext());

      SiteBuilder builder(workspace, engine);
      count = builder.export_static_site(documents);
    } else {
      BookBuilder builder(workspace,
                          BookMetadata{config.title, config.author,
                                       config.language});
      count = builder.make_book(documents, project_root / config.book_file);
    }

    std::cout << count << " documents processed" << std::endl;

  } catch (const ScribeError &e) {
    report_error(e);
    return 1;
  } catch (const std::exception &e) {
    console::error(std::string("Fatal error: ") + e.what());
    return 1;
  }

  return 0;
}
