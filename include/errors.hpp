/**
 * @file errors.hpp
 * @brief Exception types raised by autopullreview.
 *
 * Declares the review error taxonomy (configuration, input and external call
 * failures) together with the typed transport errors produced by the HTTP
 * layer.
 */

#ifndef AUTOPULLREVIEW_ERRORS_HPP
#define AUTOPULLREVIEW_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace apr {

/// Base class for every error that ends a review before a final result.
class ReviewError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Fatal setup problem such as an unavailable token counter or a non-positive
 * budget. Raised before any run starts and never retried.
 */
class ConfigurationError : public ReviewError {
public:
  using ReviewError::ReviewError;
};

/// Malformed change-set reference supplied by the caller.
class InputError : public ReviewError {
public:
  using ReviewError::ReviewError;
};

/**
 * Failure of a remote collaborator (model call or diff source) during a run.
 * The run is aborted and all partial results are discarded.
 */
class ExternalCallError : public ReviewError {
public:
  using ReviewError::ReviewError;
};

/// Transport level failure reported by libcurl (DNS, connect, timeout...).
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-successful HTTP status returned by a remote endpoint.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code of the failed response
};

} // namespace apr

#endif // AUTOPULLREVIEW_ERRORS_HPP
