/**
 * @file file_patch.hpp
 * @brief Reviewable file records built from a pull request diff listing.
 */

#ifndef AUTOPULLREVIEW_FILE_PATCH_HPP
#define AUTOPULLREVIEW_FILE_PATCH_HPP

#include "token_counter.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace apr {

/// One entry of a pull request file listing as reported by the diff source.
struct DiffEntry {
  std::string filename;             ///< Path of the changed file
  std::optional<std::string> patch; ///< Unified diff text, absent for binaries
  std::string status{"modified"};   ///< "added", "modified", "deleted", ...
};

/**
 * A modified file's reviewable unit. The token count is computed once when
 * the record is created and never changes afterwards.
 */
struct FilePatch {
  std::string filename;
  std::string content;
  std::string language;
  std::size_t token_count{0};
};

/// Reviewable patches plus the names of removed files.
struct ChangeSet {
  std::vector<FilePatch> files;
  std::vector<std::string> deleted_files;
};

/**
 * Map a filename's extension to a language tag.
 *
 * @param filename File path; only the text after the last '.' is inspected,
 *        case-insensitively.
 * @return Language tag or "unknown" when the extension is not mapped.
 */
std::string detect_language(const std::string &filename);

/**
 * Create a FilePatch and fill its token count using @p counter.
 */
FilePatch make_file_patch(std::string filename, std::string content,
                          const TokenCounter &counter);

/**
 * Convert a diff listing into a change set.
 *
 * Entries with status "deleted" or "removed" contribute only their filename to
 * ChangeSet::deleted_files. All other entries become FilePatch records in
 * listing order; an absent patch yields empty content.
 *
 * @throws InputError When an entry has an empty filename.
 */
ChangeSet build_change_set(const std::vector<DiffEntry> &entries,
                           const TokenCounter &counter);

/// Sum of the cached token counts of @p files.
std::size_t total_tokens(const std::vector<FilePatch> &files);

} // namespace apr

#endif // AUTOPULLREVIEW_FILE_PATCH_HPP
