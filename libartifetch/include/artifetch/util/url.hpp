// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_UTIL_URL_HPP
#define ARTIFETCH_UTIL_URL_HPP

#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace artifetch::util
{
    /**
     * Class representing a parsed URL.
     *
     * Fields are stored percent encoded, as found in the parsed string. The user and password
     * are decoded on access.
     */
    class URL
    {
    public:

        enum class Credentials
        {
            Show,
            Hide,
            Remove,
        };

        struct ParseError
        {
            std::string what;
        };

        inline static constexpr std::string_view https = "https";

        /**
         * Create a URL from a string.
         *
         * A missing scheme defaults to ``https``.
         */
        [[nodiscard]] static auto parse(std::string_view url) -> tl::expected<URL, ParseError>;

        URL() = default;

        [[nodiscard]] auto scheme() const -> const std::string&;
        [[nodiscard]] auto has_user() const -> bool;
        [[nodiscard]] auto user() const -> std::string;
        [[nodiscard]] auto has_password() const -> bool;
        [[nodiscard]] auto password() const -> std::string;
        [[nodiscard]] auto host() const -> const std::string&;
        [[nodiscard]] auto port() const -> const std::string&;

        /** Return the encoded path, always starts with a '/'. */
        [[nodiscard]] auto path() const -> const std::string&;
        [[nodiscard]] auto query() const -> const std::string&;
        [[nodiscard]] auto fragment() const -> const std::string&;

        /** Return the host, followed by ``:port`` when a port is explicitly given. */
        [[nodiscard]] auto authority(Credentials credentials = Credentials::Hide) const
            -> std::string;

        /** Return the full encoded URL. */
        [[nodiscard]] auto str(Credentials credentials = Credentials::Show) const -> std::string;

        /**
         * Resolve a reference (absolute or relative URL, as found in a ``href``) against
         * this URL, following RFC 3986.
         */
        [[nodiscard]] auto resolve(std::string_view reference) const
            -> tl::expected<URL, ParseError>;

    private:

        std::string m_scheme = std::string(https);
        std::string m_user = {};
        std::string m_password = {};
        std::string m_host = {};
        std::string m_port = {};
        std::string m_path = "/";
        std::string m_query = {};
        std::string m_fragment = {};
    };

    auto operator==(const URL& a, const URL& b) -> bool;
    auto operator!=(const URL& a, const URL& b) -> bool;

    /** Decode ``%XX`` escape sequences, leaving malformed sequences untouched. */
    [[nodiscard]] auto decode_percent(std::string_view input) -> std::string;

    /** Replace passwords embedded in URLs found in @p str with ``*****``. */
    [[nodiscard]] auto hide_secrets(std::string_view str) -> std::string;
}

#endif
