#include "file_patch.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <utility>

namespace apr {

std::string detect_language(const std::string &filename) {
  static const std::unordered_map<std::string, std::string> languages = {
      {"py", "python"},     {"js", "javascript"}, {"jsx", "javascript"},
      {"ts", "typescript"}, {"tsx", "typescript"}, {"md", "markdown"},
      {"txt", "text"}};
  auto dot = filename.find_last_of('.');
  if (dot == std::string::npos) {
    return "unknown";
  }
  std::string ext = filename.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  auto it = languages.find(ext);
  return it != languages.end() ? it->second : "unknown";
}

FilePatch make_file_patch(std::string filename, std::string content,
                          const TokenCounter &counter) {
  FilePatch patch;
  patch.language = detect_language(filename);
  patch.token_count = counter.count(content);
  patch.filename = std::move(filename);
  patch.content = std::move(content);
  return patch;
}

ChangeSet build_change_set(const std::vector<DiffEntry> &entries,
                           const TokenCounter &counter) {
  ChangeSet change_set;
  change_set.files.reserve(entries.size());
  for (const auto &entry : entries) {
    if (entry.filename.empty()) {
      throw InputError("Diff entry without a filename");
    }
    // GitHub reports deletions as "removed".
    if (entry.status == "deleted" || entry.status == "removed") {
      change_set.deleted_files.push_back(entry.filename);
      continue;
    }
    change_set.files.push_back(
        make_file_patch(entry.filename, entry.patch.value_or(""), counter));
  }
  return change_set;
}

std::size_t total_tokens(const std::vector<FilePatch> &files) {
  std::size_t total = 0;
  for (const auto &f : files) {
    total += f.token_count;
  }
  return total;
}

} // namespace apr
