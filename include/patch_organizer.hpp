/**
 * @file patch_organizer.hpp
 * @brief Partitioning of a change set into budgeted language buckets and
 * overflow.
 */

#ifndef AUTOPULLREVIEW_PATCH_ORGANIZER_HPP
#define AUTOPULLREVIEW_PATCH_ORGANIZER_HPP

#include "file_patch.hpp"
#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

namespace apr {

/**
 * Per-language FIFO queues of patches.
 *
 * Iteration order over languages is the order in which each language was
 * first pushed, independent of hashing.
 */
class LanguageBuckets {
public:
  /// Append @p patch to the queue of its language.
  void push(FilePatch patch);

  /// Languages in first-seen order, including drained ones.
  const std::vector<std::string> &languages() const { return order_; }

  /// Queue for @p language; empty when the language was never pushed.
  const std::deque<FilePatch> &queue(const std::string &language) const;

  /// Mutable queue for @p language.
  std::deque<FilePatch> &queue(const std::string &language);

  /// True when every queue is empty.
  bool empty() const { return remaining_ == 0; }

  /// Number of patches left across all queues.
  std::size_t remaining() const { return remaining_; }

  /// Remove the front patch of @p language's queue and return it.
  FilePatch pop_front(const std::string &language);

private:
  std::vector<std::string> order_;
  std::unordered_map<std::string, std::deque<FilePatch>> queues_;
  std::size_t remaining_{0};
};

/// Result of PatchOrganizer: in-budget buckets plus ordered overflow.
struct OrganizedPatches {
  LanguageBuckets buckets;
  std::vector<FilePatch> overflow;
};

/**
 * Greedy largest-first partition of @p patches under @p primary_budget.
 *
 * Patches are stable-sorted by descending token count. Each patch joins its
 * language bucket while the running total stays within the budget and is
 * appended to the overflow list otherwise. This is a single pass, not an
 * optimal packing: a later small patch may still fit after a larger one was
 * rejected.
 */
OrganizedPatches organize_patches(const std::vector<FilePatch> &patches,
                                  std::size_t primary_budget);

} // namespace apr

#endif // AUTOPULLREVIEW_PATCH_ORGANIZER_HPP
