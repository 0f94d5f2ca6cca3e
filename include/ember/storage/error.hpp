/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file error.hpp
 * @brief Caller-recoverable usage errors raised by collections and queries.
 *
 * @details
 * EmberDB reports programming mistakes (duplicate primary keys, lookups on
 * undeclared fields, non-primitive key values) by throwing `UsageError`.
 * Expected outcomes such as a missing key are not errors: they are reported
 * through `std::optional` return values.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace ember::storage {

/**
 * @enum ErrorCode
 * @brief Classification of a `UsageError`.
 */
enum class ErrorCode {
    DuplicateKey,      ///< `add` (or a key-changing update) hit an existing primary key.
    UnindexedField,    ///< Index-style lookup on a field that is neither primary key nor index.
    NonPrimitiveValue, ///< Primary-key or index path resolved to an object, array or null.
    InvalidSchema,     ///< Schema rejected at collection construction.
    InvalidQuery,      ///< Malformed criteria or an operator used in the wrong stage.
    InvalidDocument    ///< A document or a change set that is not a JSON object.
};

/**
 * @brief Returns a stable, human-readable name for an error code.
 */
const char* error_code_name(ErrorCode code);

/**
 * @class UsageError
 * @brief Exception thrown synchronously to the immediate caller.
 */
class UsageError : public std::runtime_error {
  public:
    UsageError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

  private:
    ErrorCode code_;
};

} // namespace ember::storage
