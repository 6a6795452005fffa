#include "pull_request_ref.hpp"
#include "errors.hpp"
#include <regex>
#include <stdexcept>

namespace apr {

PullRequestRef parse_pull_request_ref(const std::string &text) {
  static const std::regex url_re(R"(github\.com/([^/\s]+)/([^/\s]+)/pull/(\d+))");
  static const std::regex short_re(R"(^([A-Za-z0-9_.-]+)/([A-Za-z0-9_.-]+)#(\d+)$)");
  std::smatch m;
  if (!std::regex_search(text, m, url_re) &&
      !std::regex_match(text, m, short_re)) {
    throw InputError("Invalid pull request reference: " + text);
  }
  PullRequestRef ref;
  ref.owner = m[1].str();
  ref.repo = m[2].str();
  try {
    ref.number = std::stoi(m[3].str());
  } catch (const std::out_of_range &) {
    throw InputError("Pull request number out of range: " + text);
  }
  if (ref.number <= 0) {
    throw InputError("Pull request number must be positive: " + text);
  }
  return ref;
}

std::string to_string(const PullRequestRef &ref) {
  return ref.owner + "/" + ref.repo + "#" + std::to_string(ref.number);
}

} // namespace apr
