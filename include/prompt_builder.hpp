/**
 * @file prompt_builder.hpp
 * @brief Chat messages sent to the review model at each workflow stage.
 */

#ifndef AUTOPULLREVIEW_PROMPT_BUILDER_HPP
#define AUTOPULLREVIEW_PROMPT_BUILDER_HPP

#include "file_patch.hpp"
#include <string>
#include <vector>

namespace apr {

/// Single chat message; role is "system" or "user".
struct ChatMessage {
  std::string role;
  std::string content;
};

/// Reviewer instructions and the JSON answer format.
const std::string &review_system_prompt();

/**
 * Render patches as "File: name (language)" headers followed by a fenced
 * block tagged with the language, separated by blank lines.
 */
std::string format_files_content(const std::vector<FilePatch> &files);

/// One "- name" line per deleted file.
std::string format_deleted_files(const std::vector<std::string> &deleted);

/// Single-call review of a whole change set.
std::vector<ChatMessage>
build_short_review_prompt(const std::vector<FilePatch> &files,
                          const std::vector<std::string> &deleted);

/// Review of one batch of a long change set.
std::vector<ChatMessage>
build_batch_review_prompt(const std::vector<FilePatch> &batch);

/// Brief summary of one overflow chunk.
std::vector<ChatMessage>
build_overflow_summary_prompt(const std::vector<FilePatch> &chunk);

/**
 * Final synthesis across batch reviews, overflow summaries and deleted
 * files. Segments are joined in the given order.
 */
std::vector<ChatMessage>
build_synthesis_prompt(const std::vector<std::string> &batch_reviews,
                       const std::vector<std::string> &overflow_summaries,
                       const std::vector<std::string> &deleted);

} // namespace apr

#endif // AUTOPULLREVIEW_PROMPT_BUILDER_HPP
