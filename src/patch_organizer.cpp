#include "patch_organizer.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace apr {

void LanguageBuckets::push(FilePatch patch) {
  auto it = queues_.find(patch.language);
  if (it == queues_.end()) {
    order_.push_back(patch.language);
    it = queues_.emplace(patch.language, std::deque<FilePatch>{}).first;
  }
  it->second.push_back(std::move(patch));
  ++remaining_;
}

const std::deque<FilePatch> &
LanguageBuckets::queue(const std::string &language) const {
  static const std::deque<FilePatch> empty_queue;
  auto it = queues_.find(language);
  return it != queues_.end() ? it->second : empty_queue;
}

std::deque<FilePatch> &LanguageBuckets::queue(const std::string &language) {
  auto it = queues_.find(language);
  if (it == queues_.end()) {
    throw std::out_of_range("No bucket for language " + language);
  }
  return it->second;
}

FilePatch LanguageBuckets::pop_front(const std::string &language) {
  auto &q = queue(language);
  if (q.empty()) {
    throw std::out_of_range("Bucket for language " + language + " is empty");
  }
  FilePatch patch = std::move(q.front());
  q.pop_front();
  --remaining_;
  return patch;
}

OrganizedPatches organize_patches(const std::vector<FilePatch> &patches,
                                  std::size_t primary_budget) {
  std::vector<FilePatch> sorted = patches;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const FilePatch &a, const FilePatch &b) {
                     return a.token_count > b.token_count;
                   });
  OrganizedPatches result;
  std::size_t total = 0;
  for (auto &patch : sorted) {
    if (total + patch.token_count <= primary_budget) {
      total += patch.token_count;
      result.buckets.push(std::move(patch));
    } else {
      result.overflow.push_back(std::move(patch));
    }
  }
  return result;
}

} // namespace apr
