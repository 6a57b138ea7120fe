// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cassert>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

#include <curl/urlapi.h>
#include <fmt/format.h>

#include "artifetch/util/string.hpp"
#include "artifetch/util/url.hpp"

namespace artifetch::util
{
    /*******************
     *  CURL wrappers  *
     *******************/

    namespace
    {
        /**
         * A RAII ``CURLU*`` created from ``curl_url``.
         *
         * Never null, throw exception at construction if creating the handle fails.
         */
        class CurlUrl
        {
        public:

            using value_type = ::CURLU;
            using pointer = value_type*;
            using flag_type = unsigned int;

            static auto parse(const std::string& url, flag_type flags = 0)
                -> tl::expected<CurlUrl, URL::ParseError>;

            CurlUrl();

            /** Set the URL part, resolving it against the current content if relative. */
            auto set_url(const std::string& url, flag_type flags = 0)
                -> tl::expected<void, URL::ParseError>;

            [[nodiscard]] auto
            get_part(::CURLUPart part, flag_type flags = 0) const -> std::optional<std::string>;

        private:

            struct CurlDeleter
            {
                void operator()(pointer ptr);
            };

            std::unique_ptr<value_type, CurlDeleter> m_handle = nullptr;
        };

        /**
         * A RAII wrapper for string mananged by CURL.
         */
        class CurlStr
        {
        public:

            explicit CurlStr() = default;
            ~CurlStr();

            CurlStr(const CurlStr&) = delete;
            auto operator=(const CurlStr&) -> CurlStr& = delete;
            CurlStr(CurlStr&&) = delete;
            auto operator=(CurlStr&&) -> CurlStr& = delete;

            [[nodiscard]] auto raw_input() -> char**;
            [[nodiscard]] auto str() const -> std::optional<std::string_view>;

        private:

            char* m_data = nullptr;
        };

        auto CurlUrl::parse(const std::string& url, flag_type flags)
            -> tl::expected<CurlUrl, URL::ParseError>
        {
            auto out = CurlUrl();
            if (auto res = out.set_url(url, flags); !res)
            {
                return tl::make_unexpected(res.error());
            }
            return { std::move(out) };
        }

        CurlUrl::CurlUrl()
        {
            m_handle.reset(::curl_url());
            if (m_handle == nullptr)
            {
                throw std::runtime_error("Could not create CurlUrl handle");
            }
        }

        auto CurlUrl::set_url(const std::string& url, flag_type flags)
            -> tl::expected<void, URL::ParseError>
        {
            const CURLUcode uc = ::curl_url_set(m_handle.get(), CURLUPART_URL, url.c_str(), flags);
            if (uc != CURLUE_OK)
            {
                return tl::make_unexpected(URL::ParseError{
                    fmt::format(R"(Failed to parse URL "{}": {})", url, ::curl_url_strerror(uc)) });
            }
            return {};
        }

        void CurlUrl::CurlDeleter::operator()(pointer ptr)
        {
            if (ptr)
            {
                ::curl_url_cleanup(ptr);
            }
        }

        auto CurlUrl::get_part(CURLUPart part, flag_type flags) const -> std::optional<std::string>
        {
            CurlStr value{};
            const auto rc = ::curl_url_get(m_handle.get(), part, value.raw_input(), flags);
            if (!rc)
            {
                if (auto str = value.str())
                {
                    return std::string(*str);
                }
            }
            return std::nullopt;
        }

        CurlStr::~CurlStr()
        {
            ::curl_free(m_data);
            m_data = nullptr;
        }

        auto CurlStr::raw_input() -> char**
        {
            assert(m_data == nullptr);  // Otherwise we leak Curl memory
            return &m_data;
        }

        auto CurlStr::str() const -> std::optional<std::string_view>
        {
            if (m_data)
            {
                return { { m_data } };
            }
            return std::nullopt;
        }
    }

    /**********************
     *  URL implementation  *
     **********************/

    namespace
    {
        auto url_string_from_handle(const CurlUrl& handle) -> std::string
        {
            std::string out = handle.get_part(CURLUPART_SCHEME).value_or(std::string(URL::https));
            out += "://";
            if (auto user = handle.get_part(CURLUPART_USER))
            {
                out += *user;
                if (auto password = handle.get_part(CURLUPART_PASSWORD))
                {
                    out += ':';
                    out += *password;
                }
                out += '@';
            }
            out += handle.get_part(CURLUPART_HOST).value_or("");
            if (auto port = handle.get_part(CURLUPART_PORT))
            {
                out += ':';
                out += *port;
            }
            out += handle.get_part(CURLUPART_PATH).value_or("/");
            if (auto query = handle.get_part(CURLUPART_QUERY))
            {
                out += '?';
                out += *query;
            }
            if (auto fragment = handle.get_part(CURLUPART_FRAGMENT))
            {
                out += '#';
                out += *fragment;
            }
            return out;
        }
    }

    auto URL::parse(std::string_view url) -> tl::expected<URL, ParseError>
    {
        url = util::strip(url);
        if (url.empty())
        {
            return tl::make_unexpected(ParseError{ "Empty URL" });
        }
        return CurlUrl::parse(std::string(url), CURLU_NON_SUPPORT_SCHEME | CURLU_DEFAULT_SCHEME)
            .map(
                [](CurlUrl&& handle) -> URL
                {
                    auto out = URL();
                    out.m_scheme = util::to_lower(
                        handle.get_part(CURLUPART_SCHEME).value_or(std::string(https))
                    );
                    out.m_user = handle.get_part(CURLUPART_USER).value_or("");
                    out.m_password = handle.get_part(CURLUPART_PASSWORD).value_or("");
                    out.m_host = handle.get_part(CURLUPART_HOST).value_or("");
                    out.m_port = handle.get_part(CURLUPART_PORT).value_or("");
                    out.m_path = handle.get_part(CURLUPART_PATH).value_or("/");
                    out.m_query = handle.get_part(CURLUPART_QUERY).value_or("");
                    out.m_fragment = handle.get_part(CURLUPART_FRAGMENT).value_or("");
                    if (!util::starts_with(out.m_path, '/'))
                    {
                        out.m_path.insert(0, 1, '/');
                    }
                    return out;
                }
            );
    }

    auto URL::scheme() const -> const std::string&
    {
        return m_scheme;
    }

    auto URL::has_user() const -> bool
    {
        return !m_user.empty();
    }

    auto URL::user() const -> std::string
    {
        return decode_percent(m_user);
    }

    auto URL::has_password() const -> bool
    {
        return !m_password.empty();
    }

    auto URL::password() const -> std::string
    {
        return decode_percent(m_password);
    }

    auto URL::host() const -> const std::string&
    {
        return m_host;
    }

    auto URL::port() const -> const std::string&
    {
        return m_port;
    }

    auto URL::path() const -> const std::string&
    {
        return m_path;
    }

    auto URL::query() const -> const std::string&
    {
        return m_query;
    }

    auto URL::fragment() const -> const std::string&
    {
        return m_fragment;
    }

    auto URL::authority(Credentials credentials) const -> std::string
    {
        std::string out;
        if (credentials != Credentials::Remove && has_user())
        {
            out += m_user;
            if (has_password())
            {
                out += ':';
                out += (credentials == Credentials::Hide) ? std::string("*****") : m_password;
            }
            out += '@';
        }
        out += m_host;
        if (!m_port.empty())
        {
            out += ':';
            out += m_port;
        }
        return out;
    }

    auto URL::str(Credentials credentials) const -> std::string
    {
        std::string out = util::concat(m_scheme, "://", authority(credentials), m_path);
        if (!m_query.empty())
        {
            out += '?';
            out += m_query;
        }
        if (!m_fragment.empty())
        {
            out += '#';
            out += m_fragment;
        }
        return out;
    }

    auto URL::resolve(std::string_view reference) const -> tl::expected<URL, ParseError>
    {
        auto handle = CurlUrl::parse(str(Credentials::Show), CURLU_NON_SUPPORT_SCHEME);
        if (!handle)
        {
            return tl::make_unexpected(handle.error());
        }
        if (auto res = handle->set_url(std::string(reference), CURLU_NON_SUPPORT_SCHEME); !res)
        {
            return tl::make_unexpected(res.error());
        }
        return URL::parse(url_string_from_handle(*handle));
    }

    auto operator==(const URL& a, const URL& b) -> bool
    {
        return (a.str() == b.str());
    }

    auto operator!=(const URL& a, const URL& b) -> bool
    {
        return !(a == b);
    }

    /*********************************
     *  Percent decoding and secrets  *
     *********************************/

    namespace
    {
        auto hex_value(char c) -> int
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

        const std::regex& http_basicauth_regex()
        {
            static const std::regex http_basicauth_regex{ "(://|^)([^\\s:/@]+):([^\\s/@]+)@" };
            return http_basicauth_regex;
        }
    }

    auto decode_percent(std::string_view input) -> std::string
    {
        std::string out;
        out.reserve(input.size());
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            if (input[i] == '%' && i + 2 < input.size())
            {
                const int hi = hex_value(input[i + 1]);
                const int lo = hex_value(input[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    out += static_cast<char>(hi * 16 + lo);
                    i += 2;
                    continue;
                }
            }
            out += input[i];
        }
        return out;
    }

    auto hide_secrets(std::string_view str) -> std::string
    {
        return std::regex_replace(std::string(str), http_basicauth_regex(), "$1$2:*****@");
    }
}
