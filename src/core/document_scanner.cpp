#include "document_scanner.hpp"
#include "errors.hpp"

#include <algorithm>
#include <set>
#include <system_error>

bool is_hidden(const fs::path &path) {
  std::string name = path.filename().string();
  return !name.empty() && name[0] == '.';
}

// `ancestors` holds the canonical paths of the directories currently being
// walked. A link back to one of them is a loop and is not entered; any other
// directory, even one seen before through a different link, is walked again.
static void walk(const fs::path &dir, std::set<fs::path> &ancestors,
                 std::vector<Document> &documents) {
  std::error_code ec;

  fs::path canonical = fs::canonical(dir, ec);
  if (ec) {
    throw DocumentReadError("cannot resolve directory: " + ec.message(), dir);
  }
  if (!ancestors.insert(canonical).second) {
    return;
  }

  std::vector<fs::path> entries;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    throw DocumentReadError("cannot list directory: " + ec.message(), dir);
  }
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      throw DocumentReadError("cannot list directory: " + ec.message(), dir);
    }
    entries.push_back(it->path());
  }
  if (ec) {
    throw DocumentReadError("cannot list directory: " + ec.message(), dir);
  }

  std::sort(entries.begin(), entries.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().string() < b.filename().string();
            });

  for (const auto &path : entries) {
    if (is_hidden(path)) {
      continue;
    }

    fs::file_status status = fs::status(path, ec);
    if (ec) {
      throw DocumentReadError("cannot stat: " + ec.message(), path);
    }

    if (fs::is_directory(status)) {
      walk(path, ancestors, documents);
    } else if (fs::is_regular_file(status)) {
      documents.push_back(Document::load(path));
    }
  }

  ancestors.erase(canonical);
}

std::vector<Document> scan_documents(const fs::path &root) {
  std::vector<Document> documents;
  std::set<fs::path> ancestors;
  walk(root, ancestors, documents);
  return documents;
}
