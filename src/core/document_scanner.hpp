#ifndef DOCUMENT_SCANNER_HPP
#define DOCUMENT_SCANNER_HPP

#include "document.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// True when the final path component starts with '.'.
bool is_hidden(const fs::path &path);

// Walks `root` depth-first, entries of each directory in byte order of their
// names, skipping hidden entries and following symlinks. Every regular file
// becomes a Document; the first failure aborts the scan.
std::vector<Document> scan_documents(const fs::path &root);

#endif
