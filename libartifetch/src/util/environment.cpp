// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cstdlib>
#include <mutex>
#include <regex>
#include <stdexcept>

#include <fmt/format.h>

#include "artifetch/util/environment.hpp"
#include "artifetch/util/string.hpp"

namespace artifetch::util
{
    namespace
    {
        std::mutex env_mutex = {};
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        std::scoped_lock ready_to_execute{ env_mutex };
        if (const char* val = std::getenv(key.c_str()))
        {
            return { val };
        }
        return std::nullopt;
    }

    void set_env(const std::string& key, const std::string& value)
    {
        std::scoped_lock ready_to_execute{ env_mutex };
        const int res = ::setenv(key.c_str(), value.c_str(), 1);
        if (res != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}" to "{}")", key, value)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        std::scoped_lock ready_to_execute{ env_mutex };
        const int res = ::unsetenv(key.c_str());
        if (res != 0)
        {
            throw std::runtime_error(fmt::format(R"(Could not unset environment variable "{}")", key)
            );
        }
    }

    auto expandvars(std::string s) -> std::string
    {
        if (s.find('$') == std::string::npos)
        {
            return s;
        }
        static const std::regex env_var_re(R"(\$(\{\w+\}|\w+))");
        for (auto matches = std::sregex_iterator(s.begin(), s.end(), env_var_re);
             matches != std::sregex_iterator();
             ++matches)
        {
            std::smatch match = *matches;
            auto var = match[0].str();
            if (util::starts_with(var, "${"))
            {
                var = var.substr(2, var.size() - 3);
            }
            else
            {
                var = var.substr(1);
            }
            if (auto val = util::get_env(var))
            {
                s.replace(match[0].first, match[0].second, val.value());
                // Modifying the string invalidates the iterator, start a new search.
                return expandvars(s);
            }
        }
        return s;
    }
}
