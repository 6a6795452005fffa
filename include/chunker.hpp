/**
 * @file chunker.hpp
 * @brief Splitting of overflow patches into summarization chunks.
 */

#ifndef AUTOPULLREVIEW_CHUNKER_HPP
#define AUTOPULLREVIEW_CHUNKER_HPP

#include "file_patch.hpp"
#include <cstddef>
#include <vector>

namespace apr {

using PatchChunk = std::vector<FilePatch>;

/**
 * Split @p overflow into ordered chunks bounded by @p chunk_budget.
 *
 * Input order is preserved. A patch is admitted to the open chunk when the
 * chunk total plus its token count stays within the budget (inclusive). When
 * it does not fit and the open chunk already holds a patch, that chunk is
 * closed and a new one starts with the patch. A patch larger than the budget
 * therefore ends up alone in an over-budget chunk instead of being dropped.
 *
 * @param overflow Patches in the order emitted by organize_patches().
 * @param chunk_budget Per-chunk token ceiling.
 * @return Ordered chunks; empty when @p overflow is empty.
 */
std::vector<PatchChunk> chunk_patches(const std::vector<FilePatch> &overflow,
                                      std::size_t chunk_budget);

} // namespace apr

#endif // AUTOPULLREVIEW_CHUNKER_HPP
