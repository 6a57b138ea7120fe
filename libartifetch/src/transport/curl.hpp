// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_TRANSPORT_CURL_HPP
#define ARTIFETCH_TRANSPORT_CURL_HPP

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

extern "C"
{
#include <curl/curl.h>
}

#include <fmt/format.h>
#include <tl/expected.hpp>

namespace artifetch::transport
{
    namespace curl
    {
        /** Initialize libcurl globally, only the first call has an effect. */
        void init_curl_globally();

        void configure_curl_handle(
            CURL* handle,
            const std::string& url,
            const bool set_low_speed_opt,
            const double connect_timeout_secs,
            const bool set_ssl_no_revoke,
            const std::string& ssl_verify
        );
    }

    class curl_error : public std::runtime_error
    {
    public:

        curl_error(const std::string& what = "", CURLcode code = CURLE_OK);
        CURLcode code() const;

    private:

        CURLcode m_code;
    };

    class CURLId
    {
    public:

        bool operator==(const CURLId& rhs) const;

    private:

        explicit CURLId(CURL* handle = nullptr);

        CURL* p_handle;

        friend class CURLHandle;
        friend class CURLMultiHandle;
    };

    class CURLHandle
    {
    public:

        CURLHandle();
        ~CURLHandle();

        // libcurl keeps pointers to the error buffer and to the callbacks data.
        CURLHandle(const CURLHandle&) = delete;
        CURLHandle& operator=(const CURLHandle&) = delete;
        CURLHandle(CURLHandle&&) = delete;
        CURLHandle& operator=(CURLHandle&&) = delete;

        template <class T>
        tl::expected<T, CURLcode> get_info(CURLINFO option) const;

        void configure_handle(
            const std::string& url,
            const bool set_low_speed_opt,
            const double connect_timeout_secs,
            const bool set_ssl_no_revoke,
            const std::string& ssl_verify
        );

        CURLHandle& add_header(const std::string& header);

        template <class T>
        CURLHandle& set_opt(CURLoption opt, const T& val);

        CURLHandle& set_opt_header();

        /** Resume a transfer paused from a callback. */
        CURLcode unpause();

        const char* get_error_buffer() const;

        CURLId get_id() const;

        static bool is_curl_res_ok(CURLcode res);
        static std::string get_res_error(CURLcode res);

    private:

        CURL* m_handle;
        curl_slist* p_headers = nullptr;
        std::array<char, CURL_ERROR_SIZE> m_errorbuffer;

        friend CURL* unwrap(const CURLHandle&);
    };

    struct CURLMultiResponse
    {
        CURLId m_handle_id;
        CURLcode m_transfer_result;
        bool m_transfer_done;
    };

    class CURLMultiHandle
    {
    public:

        using response_type = std::optional<CURLMultiResponse>;

        explicit CURLMultiHandle(std::size_t max_parallel_transfers);
        ~CURLMultiHandle();

        CURLMultiHandle(const CURLMultiHandle&) = delete;
        CURLMultiHandle& operator=(const CURLMultiHandle&) = delete;

        CURLMultiHandle(CURLMultiHandle&&) = delete;
        CURLMultiHandle& operator=(CURLMultiHandle&&) = delete;

        void add_handle(const CURLHandle&);
        void remove_handle(const CURLHandle&);

        std::size_t perform();
        response_type pop_message();
        std::size_t get_timeout(std::size_t max_timeout = 1000u) const;
        std::size_t wait(std::size_t timeout);

    private:

        CURLM* p_handle;
    };

    template <>
    tl::expected<int, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    template <class T>
    CURLHandle& CURLHandle::set_opt(CURLoption opt, const T& val)
    {
        CURLcode ok;
        if constexpr (std::is_same<T, std::string>())
        {
            ok = curl_easy_setopt(m_handle, opt, val.c_str());
        }
        else if constexpr (std::is_same<T, bool>())
        {
            ok = curl_easy_setopt(m_handle, opt, val ? 1L : 0L);
        }
        else
        {
            ok = curl_easy_setopt(m_handle, opt, val);
        }
        if (ok != CURLE_OK)
        {
            throw curl_error(
                fmt::format("curl: curl_easy_setopt failed {}", curl_easy_strerror(ok)),
                ok
            );
        }
        return *this;
    }
}

#endif
