#include "diff_source.hpp"
#include "errors.hpp"
#include <fstream>

namespace apr {

std::vector<DiffEntry> parse_diff_entries(const nlohmann::json &listing) {
  const nlohmann::json *items = &listing;
  if (listing.is_object() && listing.contains("files")) {
    items = &listing["files"];
  }
  if (!items->is_array()) {
    throw InputError("Diff listing must be an array of file entries");
  }
  std::vector<DiffEntry> entries;
  entries.reserve(items->size());
  for (const auto &item : *items) {
    if (!item.is_object() || !item.contains("filename") ||
        !item["filename"].is_string()) {
      throw InputError("Diff entry without a string filename");
    }
    DiffEntry entry;
    entry.filename = item["filename"].get<std::string>();
    if (item.contains("patch") && item["patch"].is_string()) {
      entry.patch = item["patch"].get<std::string>();
    }
    if (item.contains("status") && item["status"].is_string()) {
      entry.status = item["status"].get<std::string>();
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<DiffEntry> load_diff_file(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw InputError("Cannot open diff file: " + path);
  }
  nlohmann::json listing;
  try {
    in >> listing;
  } catch (const nlohmann::json::exception &e) {
    throw InputError("Failed to parse diff file " + path + ": " + e.what());
  }
  return parse_diff_entries(listing);
}

} // namespace apr
