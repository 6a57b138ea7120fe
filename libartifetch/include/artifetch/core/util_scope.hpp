// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_CORE_UTIL_SCOPE_HPP
#define ARTIFETCH_CORE_UTIL_SCOPE_HPP

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "artifetch/core/logging.hpp"

namespace artifetch
{
    template <typename F>
    struct on_scope_exit
    {
        F func;

        explicit on_scope_exit(F&& f)
            : func(std::forward<F>(f))
        {
        }

        ~on_scope_exit()
        {
            try
            {
                func();
            }
            catch (const std::exception& ex)
            {
                LOG_ERROR << fmt::format("Scope exit error (caught and ignored): {}", ex.what());
            }
        }

        // Deactivate copy & move until we implement moves
        on_scope_exit(const on_scope_exit&) = delete;
        on_scope_exit& operator=(const on_scope_exit&) = delete;
        on_scope_exit(on_scope_exit&&) = delete;
        on_scope_exit& operator=(on_scope_exit&&) = delete;
    };
}

#endif
