// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_CORE_ERROR_HANDLING_HPP
#define ARTIFETCH_CORE_ERROR_HANDLING_HPP

#include <any>
#include <stdexcept>
#include <string>
#include <utility>

#include <tl/expected.hpp>

namespace artifetch
{
    /************************
     * Artifetch exceptions *
     ************************/

    enum class artifetch_error_code
    {
        unknown,
        transport_failure,
        server_error,
        precondition_violation,
        configuration_error,
        io_error,
    };

    /** Status returned by a server, attached to ``server_error`` exceptions. */
    struct http_status
    {
        int code = 0;
        std::string text = "";
    };

    class artifetch_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        artifetch_error(const std::string& msg, artifetch_error_code ec);
        artifetch_error(const char* msg, artifetch_error_code ec);
        artifetch_error(const std::string& msg, artifetch_error_code ec, std::any&& data);

        artifetch_error_code error_code() const noexcept;
        const std::any& data() const noexcept;

        /** Return the HTTP status attached to the error, or null if there is none. */
        const http_status* status() const noexcept;

    private:

        artifetch_error_code m_error_code;
        std::any m_data;
    };

    /********************************
     * wrappers around tl::expected *
     ********************************/

    template <class T, class E = artifetch_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<artifetch_error> make_unexpected(const char* msg, artifetch_error_code ec);

    tl::unexpected<artifetch_error> make_unexpected(const std::string& msg, artifetch_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp);

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp);

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp);

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp);

    /***********************************
     * helper functions implementation *
     ***********************************/

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }

    namespace detail
    {
        template <class T>
        decltype(auto) extract_impl(T&& exp)
        {
            if (exp)
            {
                return std::forward<T>(exp).value();
            }
            else
            {
                throw exp.error();
            }
        }
    }

    template <class T, class E>
    T& extract(tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    const T& extract(const tl::expected<T, E>& exp)
    {
        return detail::extract_impl(exp);
    }

    template <class T, class E>
    T&& extract(tl::expected<T, E>&& exp)
    {
        return detail::extract_impl(std::move(exp));
    }
}

#endif
