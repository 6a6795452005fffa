/**
 * @file token_counter.cpp
 * @brief BPE and approximate token counters.
 */

#include "token_counter.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <utility>

namespace apr {

namespace {

std::shared_ptr<spdlog::logger> tokenizer_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tokenizer");
  }();
  return logger;
}

bool is_newline(unsigned char c) { return c == '\r' || c == '\n'; }

bool is_space(unsigned char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

bool is_digit(unsigned char c) { return c >= '0' && c <= '9'; }

bool is_letter(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c >= 0x80;
}

bool is_symbol(unsigned char c) {
  return !is_space(c) && !is_letter(c) && !is_digit(c);
}

unsigned char at(std::string_view text, std::size_t i) {
  return static_cast<unsigned char>(text[i]);
}

/// Length of an English contraction suffix starting at @p i, or zero.
std::size_t match_contraction(std::string_view text, std::size_t i) {
  static constexpr std::array<std::string_view, 7> suffixes = {
      "s", "t", "re", "ve", "m", "ll", "d"};
  if (text[i] != '\'') {
    return 0;
  }
  for (auto suffix : suffixes) {
    if (i + 1 + suffix.size() > text.size()) {
      continue;
    }
    bool same = true;
    for (std::size_t k = 0; k < suffix.size(); ++k) {
      unsigned char c = at(text, i + 1 + k);
      if (c >= 'A' && c <= 'Z') {
        c = static_cast<unsigned char>(c - 'A' + 'a');
      }
      if (c != static_cast<unsigned char>(suffix[k])) {
        same = false;
        break;
      }
    }
    if (same) {
      return 1 + suffix.size();
    }
  }
  return 0;
}

std::size_t scan_while(std::string_view text, std::size_t i,
                       bool (*pred)(unsigned char)) {
  while (i < text.size() && pred(at(text, i))) {
    ++i;
  }
  return i;
}

std::size_t match_whitespace(std::string_view text, std::size_t i) {
  std::size_t end = scan_while(text, i, is_space);
  std::size_t last_newline = std::string_view::npos;
  for (std::size_t k = i; k < end; ++k) {
    if (is_newline(at(text, k))) {
      last_newline = k;
    }
  }
  if (last_newline != std::string_view::npos) {
    return last_newline + 1 - i;
  }
  // A trailing space is left for the following word unless the run ends the
  // text or is a single character.
  if (end == text.size() || end - i == 1) {
    return end - i;
  }
  return end - i - 1;
}

} // namespace

std::vector<std::string_view> pretokenize(std::string_view text) {
  std::vector<std::string_view> pieces;
  std::size_t i = 0;
  while (i < text.size()) {
    const unsigned char c = at(text, i);
    std::size_t len = match_contraction(text, i);
    if (len == 0) {
      if (is_letter(c)) {
        len = scan_while(text, i, is_letter) - i;
      } else if (!is_newline(c) && !is_digit(c) && i + 1 < text.size() &&
                 is_letter(at(text, i + 1))) {
        len = scan_while(text, i + 1, is_letter) - i;
      } else if (is_digit(c)) {
        std::size_t end = i;
        while (end < text.size() && end - i < 3 && is_digit(at(text, end))) {
          ++end;
        }
        len = end - i;
      } else if (is_symbol(c) ||
                 (c == ' ' && i + 1 < text.size() &&
                  is_symbol(at(text, i + 1)))) {
        std::size_t end = c == ' ' ? i + 1 : i;
        end = scan_while(text, end, is_symbol);
        end = scan_while(text, end, is_newline);
        len = end - i;
      } else {
        len = match_whitespace(text, i);
      }
    }
    pieces.push_back(text.substr(i, len));
    i += len;
  }
  return pieces;
}

std::string decode_base64(std::string_view encoded) {
  auto value_of = [](char ch) -> int {
    if (ch >= 'A' && ch <= 'Z')
      return ch - 'A';
    if (ch >= 'a' && ch <= 'z')
      return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9')
      return ch - '0' + 52;
    if (ch == '+')
      return 62;
    if (ch == '/')
      return 63;
    return -1;
  };
  std::string out;
  out.reserve(encoded.size() * 3 / 4);
  unsigned int buffer = 0;
  int bits = 0;
  for (char ch : encoded) {
    if (ch == '=') {
      break;
    }
    int v = value_of(ch);
    if (v < 0) {
      throw std::invalid_argument("invalid base64 character");
    }
    buffer = (buffer << 6) | static_cast<unsigned int>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((buffer >> bits) & 0xFFU));
    }
  }
  return out;
}

BpeTokenCounter::BpeTokenCounter(const std::string &vocabulary_path) {
  tokenizer_log()->debug("Loading BPE vocabulary from {}", vocabulary_path);
  std::ifstream in(vocabulary_path);
  if (!in) {
    throw ConfigurationError("Token vocabulary not readable: " +
                             vocabulary_path);
  }
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    auto space = line.find(' ');
    if (space == std::string::npos || space == 0) {
      throw ConfigurationError("Malformed token vocabulary " + vocabulary_path +
                               " at line " + std::to_string(line_no));
    }
    try {
      std::string token = decode_base64(std::string_view(line).substr(0, space));
      unsigned long rank = std::stoul(line.substr(space + 1));
      if (rank > std::numeric_limits<std::uint32_t>::max()) {
        throw std::out_of_range("rank");
      }
      ranks_.emplace(std::move(token), static_cast<std::uint32_t>(rank));
    } catch (const std::logic_error &) {
      throw ConfigurationError("Malformed token vocabulary " + vocabulary_path +
                               " at line " + std::to_string(line_no));
    }
  }
  if (ranks_.empty()) {
    throw ConfigurationError("Token vocabulary is empty: " + vocabulary_path);
  }
  tokenizer_log()->info("Loaded {} BPE ranks from {}", ranks_.size(),
                        vocabulary_path);
}

BpeTokenCounter::BpeTokenCounter(
    std::unordered_map<std::string, std::uint32_t> ranks)
    : ranks_(std::move(ranks)) {
  if (ranks_.empty()) {
    throw ConfigurationError("Token vocabulary is empty");
  }
}

std::size_t BpeTokenCounter::count_piece(std::string_view piece) const {
  if (piece.empty()) {
    return 0;
  }
  if (ranks_.count(std::string(piece)) != 0) {
    return 1;
  }
  // Part boundaries; part k spans [bounds[k], bounds[k + 1]).
  std::vector<std::size_t> bounds(piece.size() + 1);
  for (std::size_t i = 0; i < bounds.size(); ++i) {
    bounds[i] = i;
  }
  std::string key;
  while (bounds.size() > 2) {
    std::uint32_t best_rank = std::numeric_limits<std::uint32_t>::max();
    std::size_t best = bounds.size();
    for (std::size_t k = 0; k + 2 < bounds.size(); ++k) {
      key.assign(piece.data() + bounds[k], bounds[k + 2] - bounds[k]);
      auto it = ranks_.find(key);
      if (it != ranks_.end() && it->second < best_rank) {
        best_rank = it->second;
        best = k;
      }
    }
    if (best == bounds.size()) {
      break;
    }
    bounds.erase(bounds.begin() + static_cast<std::ptrdiff_t>(best + 1));
  }
  return bounds.size() - 1;
}

std::size_t BpeTokenCounter::count(std::string_view content) const {
  std::size_t total = 0;
  for (auto piece : pretokenize(content)) {
    total += count_piece(piece);
  }
  return total;
}

std::size_t ApproximateTokenCounter::count(std::string_view content) const {
  std::size_t total = 0;
  for (auto piece : pretokenize(content)) {
    total += std::max<std::size_t>(1, (piece.size() + 3) / 4);
  }
  return total;
}

std::unique_ptr<TokenCounter>
make_token_counter(const TokenizerSettings &settings) {
  if (settings.mode == "bpe") {
    if (settings.vocabulary_path.empty()) {
      throw ConfigurationError("BPE tokenizer requires a vocabulary path");
    }
    return std::make_unique<BpeTokenCounter>(settings.vocabulary_path);
  }
  if (settings.mode == "approximate") {
    tokenizer_log()->info("Using approximate token counting");
    return std::make_unique<ApproximateTokenCounter>();
  }
  throw ConfigurationError("Unknown tokenizer '" + settings.mode +
                           "' (expected bpe or approximate)");
}

} // namespace apr
