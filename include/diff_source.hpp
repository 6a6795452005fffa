/**
 * @file diff_source.hpp
 * @brief Providers of pull request file listings.
 */

#ifndef AUTOPULLREVIEW_DIFF_SOURCE_HPP
#define AUTOPULLREVIEW_DIFF_SOURCE_HPP

#include "file_patch.hpp"
#include "pull_request_ref.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace apr {

/** Interface for fetching the ordered file listing of a pull request. */
class DiffSource {
public:
  virtual ~DiffSource() = default;

  /**
   * Fetch the file entries of @p ref in host order.
   *
   * @throws ExternalCallError When the listing cannot be retrieved.
   */
  virtual std::vector<DiffEntry> fetch(const PullRequestRef &ref) = 0;
};

/**
 * Convert a JSON file listing into diff entries.
 *
 * Accepts an array of objects with `filename`, optional `patch` and optional
 * `status` (defaulting to "modified"), or an object wrapping such an array in
 * a `files` member. A null patch is treated as absent.
 *
 * @throws InputError When the document does not have that shape.
 */
std::vector<DiffEntry> parse_diff_entries(const nlohmann::json &listing);

/**
 * Read a JSON file listing from disk.
 *
 * @throws InputError When the file is missing or malformed.
 */
std::vector<DiffEntry> load_diff_file(const std::string &path);

} // namespace apr

#endif // AUTOPULLREVIEW_DIFF_SOURCE_HPP
