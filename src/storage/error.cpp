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
 * @file error.cpp
 * @brief Implementation of the usage error type.
 */

#include "ember/storage/error.hpp"

namespace ember::storage {

const char* error_code_name(ErrorCode code)
{
    switch (code) {
    case ErrorCode::DuplicateKey:
        return "DuplicateKey";
    case ErrorCode::UnindexedField:
        return "UnindexedField";
    case ErrorCode::NonPrimitiveValue:
        return "NonPrimitiveValue";
    case ErrorCode::InvalidSchema:
        return "InvalidSchema";
    case ErrorCode::InvalidQuery:
        return "InvalidQuery";
    case ErrorCode::InvalidDocument:
        return "InvalidDocument";
    }
    return "Unknown";
}

UsageError::UsageError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string("EmberDB: ") + error_code_name(code) + ": " + message),
      code_(code)
{
}

} // namespace ember::storage
