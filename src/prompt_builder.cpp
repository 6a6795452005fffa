#include "prompt_builder.hpp"
#include <sstream>

namespace apr {

namespace {

std::string join(const std::vector<std::string> &parts,
                 const std::string &separator) {
  std::ostringstream out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i != 0) {
      out << separator;
    }
    out << parts[i];
  }
  return out.str();
}

} // namespace

const std::string &review_system_prompt() {
  static const std::string prompt =
      R"(You are PR-Reviewer, an advanced model designed to provide precise, constructive feedback and actionable code improvement suggestions for Git Pull Requests (PRs).
Your primary task is to analyze the PR diff (lines prefixed with `+`) and offer meaningful insights that improve code quality and address potential issues.

---

### Guidelines:
1. Focus Areas:
- Identify and address code problems, bugs, error handling or logical issues.
- Suggest improvements for performance, modularity, and adherence to best practices.
- Ensure your feedback is relevant and avoids duplicating changes already implemented in the PR.
2. **Avoid suggesting**:
- Adding docstrings, type hints, or comments unless absolutely necessary.
3. Ensure feedback is **concise** and actionable.

### Security Analysis:
- **Check for vulnerabilities** such as sensitive information exposure, SQL injection, cross-site scripting (XSS), or other security risks.
- If a vulnerability is detected, begin with a header (e.g., `Sensitive information exposure: ...`) and provide a clear explanation of the issue along with mitigation strategies.
- If no vulnerabilities are found for a file, do not mention it in the response.

---

### Output Format:
Respond strictly in the following JSON format:
{
    "files": [
        {
            "name": "filename.py",
            "issues": [
                {
                    "type": "issue_type",
                    "line": line_number,
                    "description": "Detailed description of the issue.",
                    "suggestion": "Actionable suggestion to resolve the issue."
                }
            ],
            "code_suggestions": [
                {
                    "line": line_number,
                    "suggestion": "Actionable suggestion to improve the code."
                }
            ],
            "security_analysis": "No vulnerabilities detected or a detailed explanation of the vulnerabilities found."
        }
    ]
}

---

### Example Scenarios for Feedback:
1. **Bug Detection**: Identify logical errors or broken code paths.
- Example: Detect and highlight unreachable code or incorrect logic.
2. **Performance Improvements**: Suggest optimizations for slow or inefficient code.
- Example: Recommend a more efficient algorithm or data structure where appropriate.
3. **Modularity and Best Practices**: Improve code organization, reuse, or adherence to coding standards.
- Example: Recommend extracting repeated logic into helper functions.

Deliver feedback that is concise, focused, and actionable, enabling developers to address issues efficiently while improving the overall code quality.)";
  return prompt;
}

std::string format_files_content(const std::vector<FilePatch> &files) {
  std::vector<std::string> blocks;
  blocks.reserve(files.size());
  for (const auto &f : files) {
    blocks.push_back("File: " + f.filename + " (" + f.language + ")\n```" +
                     f.language + "\n" + f.content + "\n```");
  }
  return join(blocks, "\n\n");
}

std::string format_deleted_files(const std::vector<std::string> &deleted) {
  std::vector<std::string> lines;
  lines.reserve(deleted.size());
  for (const auto &name : deleted) {
    lines.push_back("- " + name);
  }
  return join(lines, "\n");
}

std::vector<ChatMessage>
build_short_review_prompt(const std::vector<FilePatch> &files,
                          const std::vector<std::string> &deleted) {
  std::string user = "Review the following PR changes:\n\n" +
                     format_files_content(files) + "\n\nDeleted files:\n" +
                     format_deleted_files(deleted) +
                     "\n\nPlease provide:\n"
                     "1. A summary of the changes\n"
                     "2. Potential issues or concerns\n"
                     "3. Suggestions for improvement\n"
                     "4. Overall assessment";
  return {{"system", review_system_prompt()}, {"user", std::move(user)}};
}

std::vector<ChatMessage>
build_batch_review_prompt(const std::vector<FilePatch> &batch) {
  std::string user = "Review this batch of files from a larger PR:\n\n" +
                     format_files_content(batch) +
                     "\n\nFocus on:\n"
                     "1. Key changes and their impact\n"
                     "2. Potential issues\n"
                     "3. Specific suggestions for this batch";
  return {{"user", std::move(user)}};
}

std::vector<ChatMessage>
build_overflow_summary_prompt(const std::vector<FilePatch> &chunk) {
  std::string user =
      "Provide a brief summary of these additional modified files:\n\n" +
      format_files_content(chunk) +
      "\n\nFocus on:\n"
      "1. Key changes (2-3 sentences per file)\n"
      "2. Any potential risks or concerns";
  return {{"user", std::move(user)}};
}

std::vector<ChatMessage>
build_synthesis_prompt(const std::vector<std::string> &batch_reviews,
                       const std::vector<std::string> &overflow_summaries,
                       const std::vector<std::string> &deleted) {
  std::string summaries = overflow_summaries.empty()
                              ? std::string("No additional files to summarize.")
                              : join(overflow_summaries, "\n\n");
  std::string user =
      "Synthesize the PR review into a cohesive final review:\n\n"
      "Main Review Segments:\n" +
      join(batch_reviews, "\n\n---\n\n") +
      "\n\nAdditional Modified Files Summary:\n" + summaries +
      "\n\nDeleted Files:\n" + format_deleted_files(deleted) +
      "\n\nProvide:\n"
      "1. Overall summary of changes\n"
      "2. Key concerns across all segments\n"
      "3. Major recommendations\n"
      "4. Final assessment";
  return {{"system", review_system_prompt()}, {"user", std::move(user)}};
}

} // namespace apr
