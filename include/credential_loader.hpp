/**
 * @file credential_loader.hpp
 * @brief Loading of GitHub tokens and model API keys.
 *
 * Credentials may be supplied directly, read from JSON, YAML, TOML or plain
 * text files, or taken from environment variables.
 */
#ifndef AUTOPULLREVIEW_CREDENTIAL_LOADER_HPP
#define AUTOPULLREVIEW_CREDENTIAL_LOADER_HPP

#include <string>
#include <vector>

namespace apr {

/**
 * Load secrets from a credential file.
 *
 * JSON, YAML and TOML files may contain a flat array of strings or an
 * object/table with a single `token` string and/or a `tokens` array. Files
 * ending in `.txt` or without an extension hold one secret per non-empty
 * line.
 *
 * @param path Filesystem path to the credential file
 * @return Secrets in file order
 * @throws ConfigurationError On unsupported formats, read or parse errors
 */
std::vector<std::string> load_credentials_from_file(const std::string &path);

/**
 * Collect GitHub tokens.
 *
 * Explicit tokens come first, followed by tokens from each file. When the
 * result is still empty the `GITHUB_TOKEN` environment variable is used.
 * Duplicates are dropped while preserving order.
 */
std::vector<std::string>
resolve_github_tokens(const std::vector<std::string> &explicit_tokens,
                      const std::vector<std::string> &token_files);

/**
 * Resolve the model API key.
 *
 * Precedence: @p explicit_key, then the first secret of @p key_file, then the
 * environment variable named @p env_var.
 *
 * @return The key, or an empty string when none is available.
 */
std::string resolve_model_api_key(const std::string &explicit_key,
                                  const std::string &key_file,
                                  const std::string &env_var);

} // namespace apr

#endif // AUTOPULLREVIEW_CREDENTIAL_LOADER_HPP
