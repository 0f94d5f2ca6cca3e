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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "ember/infra/string.hpp"

#include <cctype>

namespace ember::infra {

std::vector<std::string> String::split(const std::string& s, char delimiter)
{
    std::vector<std::string> parts;
    std::string::size_type start = 0;

    while (true) {
        auto pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string String::join(const std::vector<std::string>& parts, char delimiter)
{
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out.push_back(delimiter);
        }
        out += parts[i];
    }
    return out;
}

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note `static_cast<unsigned char>` avoids undefined behaviour in
 * `std::isspace` for negative `char` values.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

} // namespace ember::infra
