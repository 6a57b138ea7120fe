// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "artifetch/core/error_handling.hpp"

namespace artifetch
{
    artifetch_error::artifetch_error(const std::string& msg, artifetch_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    artifetch_error::artifetch_error(const char* msg, artifetch_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    artifetch_error::artifetch_error(const std::string& msg, artifetch_error_code ec, std::any&& data)
        : base_type(msg)
        , m_error_code(ec)
        , m_data(std::move(data))
    {
    }

    artifetch_error_code artifetch_error::error_code() const noexcept
    {
        return m_error_code;
    }

    const std::any& artifetch_error::data() const noexcept
    {
        return m_data;
    }

    const http_status* artifetch_error::status() const noexcept
    {
        return std::any_cast<http_status>(&m_data);
    }

    tl::unexpected<artifetch_error> make_unexpected(const char* msg, artifetch_error_code ec)
    {
        return tl::make_unexpected(artifetch_error(msg, ec));
    }

    tl::unexpected<artifetch_error> make_unexpected(const std::string& msg, artifetch_error_code ec)
    {
        return tl::make_unexpected(artifetch_error(msg, ec));
    }
}
