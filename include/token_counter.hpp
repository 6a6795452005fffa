/**
 * @file token_counter.hpp
 * @brief Token counting policies used for every budgeting decision.
 */

#ifndef AUTOPULLREVIEW_TOKEN_COUNTER_HPP
#define AUTOPULLREVIEW_TOKEN_COUNTER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace apr {

/** Interface converting content into model budget units. */
class TokenCounter {
public:
  virtual ~TokenCounter() = default;

  /**
   * Count the tokens in @p content.
   *
   * Implementations are deterministic and free of side effects; empty
   * content counts as zero.
   */
  virtual std::size_t count(std::string_view content) const = 0;

  /// Short policy name used in log messages.
  virtual std::string name() const = 0;
};

/**
 * Split text into pre-tokenization pieces following the cl100k split rules.
 *
 * Non-ASCII bytes are treated as letters so multi-byte UTF-8 sequences stay
 * inside word pieces.
 *
 * @param text Input text.
 * @return Views into @p text covering it completely and in order.
 */
std::vector<std::string_view> pretokenize(std::string_view text);

/**
 * Byte-pair-encoding counter backed by a tiktoken rank file.
 *
 * The rank file holds one `<base64 token> <rank>` pair per line, as
 * distributed for the `cl100k_base` encoding.
 */
class BpeTokenCounter : public TokenCounter {
public:
  /**
   * Load the vocabulary from @p vocabulary_path.
   *
   * @throws ConfigurationError When the file is missing, empty or malformed.
   */
  explicit BpeTokenCounter(const std::string &vocabulary_path);

  /// Construct from an in-memory rank table.
  explicit BpeTokenCounter(std::unordered_map<std::string, std::uint32_t> ranks);

  std::size_t count(std::string_view content) const override;
  std::string name() const override { return "bpe"; }

  /// Number of entries in the loaded vocabulary.
  std::size_t vocabulary_size() const { return ranks_.size(); }

private:
  std::size_t count_piece(std::string_view piece) const;

  std::unordered_map<std::string, std::uint32_t> ranks_;
};

/**
 * Cheap counter charging one token per four bytes of every pre-tokenized
 * piece (at least one per piece).
 */
class ApproximateTokenCounter : public TokenCounter {
public:
  std::size_t count(std::string_view content) const override;
  std::string name() const override { return "approximate"; }
};

/// Tokenizer selection read from configuration.
struct TokenizerSettings {
  std::string mode{"bpe"};                           ///< "bpe" or "approximate"
  std::string vocabulary_path{"cl100k_base.tiktoken"}; ///< BPE rank file
};

/**
 * Create the counter selected by @p settings.
 *
 * @throws ConfigurationError For unknown modes or an unusable vocabulary.
 */
std::unique_ptr<TokenCounter> make_token_counter(const TokenizerSettings &settings);

/**
 * Decode standard base64 text.
 *
 * @throws std::invalid_argument On characters outside the base64 alphabet.
 */
std::string decode_base64(std::string_view encoded);

} // namespace apr

#endif // AUTOPULLREVIEW_TOKEN_COUNTER_HPP
