// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>

#include "artifetch/util/string.hpp"

namespace artifetch::util
{
    /****************************************
     *  Implementation of cctype functions  *
     ****************************************/

    auto is_space(char c) -> bool
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    auto is_graphic(char c) -> bool
    {
        return std::isgraph(static_cast<unsigned char>(c)) != 0;
    }

    auto is_hex_digit(char c) -> bool
    {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string(str);
        std::transform(out.cbegin(), out.cend(), out.begin(), [](char c) { return to_lower(c); });
        return out;
    }

    /***************************************************
     *  Implementation of start_with, ends_with, etc.  *
     ***************************************************/

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    auto starts_with(std::string_view str, std::string_view::value_type c) -> bool
    {
        return (!str.empty()) && (str.front() == c);
    }

    auto ends_with(std::string_view str, std::string_view suffix) -> bool
    {
        return str.size() >= suffix.size()
               && 0 == str.compare(str.size() - suffix.size(), suffix.size(), suffix);
    }

    auto ends_with(std::string_view str, std::string_view::value_type c) -> bool
    {
        return (!str.empty()) && (str.back() == c);
    }

    auto contains(std::string_view str, std::string_view sub_str) -> bool
    {
        return str.find(sub_str) != std::string::npos;
    }

    auto contains(std::string_view str, char c) -> bool
    {
        return str.find(c) != std::string::npos;
    }

    auto iequals(std::string_view lhs, std::string_view rhs) -> bool
    {
        return lhs.size() == rhs.size()
               && std::equal(
                   lhs.cbegin(),
                   lhs.cend(),
                   rhs.cbegin(),
                   [](char a, char b) { return to_lower(a) == to_lower(b); }
               );
    }

    /*************************************
     *  Implementation of strip functions  *
     *************************************/

    auto strip_parts(std::string_view input, std::string_view chars) -> std::array<std::string_view, 3>
    {
        const std::size_t start = input.find_first_not_of(chars);
        if (start == std::string_view::npos)
        {
            return { input, {}, {} };
        }
        const std::size_t end = input.find_last_not_of(chars) + 1;
        const std::size_t length = end - start;
        return { input.substr(0, start), input.substr(start, length), input.substr(end) };
    }

    namespace
    {
        constexpr std::string_view whitespaces = " \t\n\v\f\r";
    }

    auto lstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const std::size_t start = input.find_first_not_of(chars);
        return (start == std::string_view::npos) ? std::string_view{} : input.substr(start);
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip(input, whitespaces);
    }

    auto rstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const std::size_t end = input.find_last_not_of(chars);
        return (end == std::string_view::npos) ? std::string_view{} : input.substr(0, end + 1);
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip(input, whitespaces);
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        return strip_parts(input, chars)[1];
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return strip(input, whitespaces);
    }

    /**************************************
     *  Implementation of split functions  *
     **************************************/

    auto split(std::string_view input, std::string_view sep) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        if (sep.empty())
        {
            result.emplace_back(input);
            return result;
        }

        std::size_t start = 0;
        std::size_t pos = input.find(sep);
        while (pos != std::string_view::npos)
        {
            result.emplace_back(input.substr(start, pos - start));
            start = pos + sep.size();
            pos = input.find(sep, start);
        }
        result.emplace_back(input.substr(start));
        return result;
    }

    auto split_whitespace(std::string_view input) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        std::size_t pos = input.find_first_not_of(whitespaces);
        while (pos != std::string_view::npos)
        {
            const std::size_t end = input.find_first_of(whitespaces, pos);
            result.emplace_back(input.substr(pos, end - pos));
            pos = input.find_first_not_of(whitespaces, end);
        }
        return result;
    }

    auto is_hex_string(std::string_view input) -> bool
    {
        return !input.empty() && std::all_of(input.cbegin(), input.cend(), &is_hex_digit);
    }
}
