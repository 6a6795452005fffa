#include "chunker.hpp"

namespace apr {

std::vector<PatchChunk> chunk_patches(const std::vector<FilePatch> &overflow,
                                      std::size_t chunk_budget) {
  std::vector<PatchChunk> chunks;
  PatchChunk current;
  std::size_t current_tokens = 0;
  for (const auto &patch : overflow) {
    if (!current.empty() && current_tokens + patch.token_count > chunk_budget) {
      chunks.push_back(std::move(current));
      current.clear();
      current_tokens = 0;
    }
    current.push_back(patch);
    current_tokens += patch.token_count;
  }
  if (!current.empty()) {
    chunks.push_back(std::move(current));
  }
  return chunks;
}

} // namespace apr
