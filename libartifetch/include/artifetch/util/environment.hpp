// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_UTIL_ENVIRONMENT_HPP
#define ARTIFETCH_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>

namespace artifetch::util
{
    /**
     * Get an environment variable.
     */
    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;

    void set_env(const std::string& key, const std::string& value);

    void unset_env(const std::string& key);

    /**
     * Expand ``$VAR`` and ``${VAR}`` occurences with the value of the environment variable.
     *
     * Undefined variables are left untouched.
     */
    [[nodiscard]] auto expandvars(std::string s) -> std::string;
}

#endif
