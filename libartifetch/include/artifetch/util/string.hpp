// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_UTIL_STRING_HPP
#define ARTIFETCH_UTIL_STRING_HPP

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace artifetch::util
{
    [[nodiscard]] auto is_space(char c) -> bool;
    [[nodiscard]] auto is_graphic(char c) -> bool;
    [[nodiscard]] auto is_hex_digit(char c) -> bool;

    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;
    [[nodiscard]] auto starts_with(std::string_view str, std::string_view::value_type c) -> bool;

    [[nodiscard]] auto ends_with(std::string_view str, std::string_view suffix) -> bool;
    [[nodiscard]] auto ends_with(std::string_view str, std::string_view::value_type c) -> bool;

    [[nodiscard]] auto contains(std::string_view str, std::string_view sub_str) -> bool;
    [[nodiscard]] auto contains(std::string_view str, char c) -> bool;

    /** Case insensitive comparison of ASCII strings. */
    [[nodiscard]] auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

    [[nodiscard]] auto lstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split the input in the part before the first stripped character, the stripped
     * middle, and the part after the last stripped character.
     */
    [[nodiscard]] auto strip_parts(std::string_view input, std::string_view chars)
        -> std::array<std::string_view, 3>;

    /**
     * Split a string on a separator.
     *
     * Empty tokens are kept, hence splitting ``"a,,b"`` on ``","`` yields three elements.
     */
    [[nodiscard]] auto split(std::string_view input, std::string_view sep)
        -> std::vector<std::string>;

    /** Split on any sequence of whitespaces, never returning empty tokens. */
    [[nodiscard]] auto split_whitespace(std::string_view input) -> std::vector<std::string>;

    /** Return ``true`` if the string is non empty and only made of hexadecimal digits. */
    [[nodiscard]] auto is_hex_string(std::string_view input) -> bool;

    template <class... Args>
    [[nodiscard]] auto concat(const Args&... args) -> std::string;

    /********************
     *  Implementation  *
     ********************/

    template <class... Args>
    auto concat(const Args&... args) -> std::string
    {
        std::string result;
        result.reserve((std::string_view(args).size() + ... + 0));
        (result.append(std::string_view(args)), ...);
        return result;
    }
}

#endif
