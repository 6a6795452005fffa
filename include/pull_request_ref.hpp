#ifndef AUTOPULLREVIEW_PULL_REQUEST_REF_HPP
#define AUTOPULLREVIEW_PULL_REQUEST_REF_HPP

#include <string>

namespace apr {

/// Identifies one pull request on the source-control host.
struct PullRequestRef {
  std::string owner; ///< Repository owner
  std::string repo;  ///< Repository name
  int number{0};     ///< Pull request number
};

/**
 * Parse a pull request reference.
 *
 * Accepted forms are a pull request URL containing
 * `github.com/<owner>/<repo>/pull/<number>` and the short form
 * `<owner>/<repo>#<number>`.
 *
 * @throws InputError When @p text matches neither form or the number is not a
 *         positive integer.
 */
PullRequestRef parse_pull_request_ref(const std::string &text);

/// Render @p ref in the short `owner/repo#number` form.
std::string to_string(const PullRequestRef &ref);

} // namespace apr

#endif // AUTOPULLREVIEW_PULL_REQUEST_REF_HPP
