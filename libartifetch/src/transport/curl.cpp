// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <filesystem>
#include <mutex>
#include <new>

#include "artifetch/core/logging.hpp"
#include "artifetch/util/environment.hpp"

#include "curl.hpp"

namespace artifetch::transport
{
    namespace curl
    {
        void init_curl_globally()
        {
            static std::once_flag init_flag;
            std::call_once(
                init_flag,
                []
                {
                    const CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
                    if (res != CURLE_OK)
                    {
                        throw curl_error(
                            fmt::format("Could not initialize libcurl: {}", curl_easy_strerror(res)),
                            res
                        );
                    }
                }
            );
        }

        void configure_curl_handle(
            CURL* handle,
            const std::string& url,
            const bool set_low_speed_opt,
            const double connect_timeout_secs,
            const bool set_ssl_no_revoke,
            const std::string& ssl_verify
        )
        {
            curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
            curl_easy_setopt(handle, CURLOPT_NETRC, CURL_NETRC_OPTIONAL);
            curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

            // if NETRC is exported in ENV, we forward it to curl
            std::string netrc_file = util::get_env("NETRC").value_or("");
            if (netrc_file != "")
            {
                curl_easy_setopt(handle, CURLOPT_NETRC_FILE, netrc_file.c_str());
            }

            curl_easy_setopt(handle, CURLOPT_BUFFERSIZE, 100L * 1024L);

            // The status line is parsed from the headers.
            curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

            if (set_low_speed_opt)
            {
                curl_easy_setopt(handle, CURLOPT_LOW_SPEED_TIME, 60L);
                curl_easy_setopt(handle, CURLOPT_LOW_SPEED_LIMIT, 30L);
            }

            // Milliseconds keep fractions of seconds.
            curl_easy_setopt(
                handle,
                CURLOPT_CONNECTTIMEOUT_MS,
                static_cast<long>(connect_timeout_secs * 1000.)
            );

            if (set_ssl_no_revoke)
            {
                curl_easy_setopt(handle, CURLOPT_SSL_OPTIONS, CURLSSLOPT_NO_REVOKE);
            }

            if (ssl_verify.size())
            {
                if (ssl_verify == "<false>")
                {
                    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 0L);
                    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 0L);
                    curl_easy_setopt(handle, CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
                    curl_easy_setopt(handle, CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
                }
                else
                {
                    if (!std::filesystem::exists(ssl_verify))
                    {
                        throw curl_error("ssl_verify does not contain a valid file path.");
                    }
                    curl_easy_setopt(handle, CURLOPT_CAINFO, ssl_verify.c_str());
                    curl_easy_setopt(handle, CURLOPT_PROXY_CAINFO, ssl_verify.c_str());
                }
            }
        }
    }

    /**************
     * curl_error *
     **************/

    curl_error::curl_error(const std::string& what, CURLcode code)
        : std::runtime_error(what)
        , m_code(code)
    {
    }

    CURLcode curl_error::code() const
    {
        return m_code;
    }

    /**********
     * CURLId *
     **********/

    CURLId::CURLId(CURL* handle)
        : p_handle(handle)
    {
    }

    bool CURLId::operator==(const CURLId& rhs) const
    {
        return p_handle == rhs.p_handle;
    }

    /**************
     * CURLHandle *
     **************/

    CURLHandle::CURLHandle()
        : m_handle(curl_easy_init())
    {
        if (m_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL handle");
        }

        // Set error buffer
        std::fill(m_errorbuffer.begin(), m_errorbuffer.end(), '\0');
        set_opt(CURLOPT_ERRORBUFFER, m_errorbuffer.data());
    }

    CURLHandle::~CURLHandle()
    {
        curl_easy_cleanup(m_handle);
        curl_slist_free_all(p_headers);
    }

    template <class T>
    tl::expected<T, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        T val;
        CURLcode result = curl_easy_getinfo(m_handle, option, &val);
        if (result != CURLE_OK)
        {
            return tl::unexpected(result);
        }
        return val;
    }

    // curl_easy_getinfo MUST have its third argument pointing to long or
    // curl_off_t depending on the option.
    // `curl_off_t` is either `long` or `long long` depending on the platform.

    template tl::expected<long, CURLcode> CURLHandle::get_info(CURLINFO option) const;
    template tl::expected<long long, CURLcode> CURLHandle::get_info(CURLINFO option) const;

    template <>
    tl::expected<int, CURLcode> CURLHandle::get_info(CURLINFO option) const
    {
        auto res = get_info<long>(option);
        if (res)
        {
            return static_cast<int>(res.value());
        }
        else
        {
            return tl::unexpected(res.error());
        }
    }

    void CURLHandle::configure_handle(
        const std::string& url,
        const bool set_low_speed_opt,
        const double connect_timeout_secs,
        const bool set_ssl_no_revoke,
        const std::string& ssl_verify
    )
    {
        curl::configure_curl_handle(
            m_handle,
            url,
            set_low_speed_opt,
            connect_timeout_secs,
            set_ssl_no_revoke,
            ssl_verify
        );
    }

    CURLHandle& CURLHandle::add_header(const std::string& header)
    {
        curl_slist* headers = curl_slist_append(p_headers, header.c_str());
        if (!headers)
        {
            throw std::bad_alloc();
        }
        p_headers = headers;
        return *this;
    }

    CURLHandle& CURLHandle::set_opt_header()
    {
        set_opt(CURLOPT_HTTPHEADER, p_headers);
        return *this;
    }

    CURLcode CURLHandle::unpause()
    {
        return curl_easy_pause(m_handle, CURLPAUSE_CONT);
    }

    const char* CURLHandle::get_error_buffer() const
    {
        return m_errorbuffer.data();
    }

    CURLId CURLHandle::get_id() const
    {
        return CURLId(m_handle);
    }

    bool CURLHandle::is_curl_res_ok(CURLcode res)
    {
        return res == CURLE_OK;
    }

    std::string CURLHandle::get_res_error(CURLcode res)
    {
        return static_cast<std::string>(curl_easy_strerror(res));
    }

    CURL* unwrap(const CURLHandle& h)
    {
        return h.m_handle;
    }

    /*******************
     * CURLMultiHandle *
     *******************/

    CURLMultiHandle::CURLMultiHandle(std::size_t max_parallel_transfers)
        : p_handle(curl_multi_init())
    {
        if (p_handle == nullptr)
        {
            throw curl_error("Could not initialize CURL multi handle");
        }
        else
        {
            curl_multi_setopt(
                p_handle,
                CURLMOPT_MAX_TOTAL_CONNECTIONS,
                static_cast<long>(max_parallel_transfers)
            );
        }
    }

    CURLMultiHandle::~CURLMultiHandle()
    {
        curl_multi_cleanup(p_handle);
        p_handle = nullptr;
    }

    void CURLMultiHandle::add_handle(const CURLHandle& h)
    {
        CURL* unw = unwrap(h);
        CURLMcode code = curl_multi_add_handle(p_handle, unw);
        if (code != CURLM_CALL_MULTI_PERFORM)
        {
            if (code != CURLM_OK)
            {
                throw curl_error(curl_multi_strerror(code));
            }
        }
    }

    void CURLMultiHandle::remove_handle(const CURLHandle& h)
    {
        curl_multi_remove_handle(p_handle, unwrap(h));
    }

    std::size_t CURLMultiHandle::perform()
    {
        int still_running;
        CURLMcode code = curl_multi_perform(p_handle, &still_running);
        if (code != CURLM_OK)
        {
            throw curl_error(curl_multi_strerror(code));
        }
        return static_cast<std::size_t>(still_running);
    }

    CURLMultiHandle::response_type CURLMultiHandle::pop_message()
    {
        int msgs_in_queue;
        CURLMsg* msg = curl_multi_info_read(p_handle, &msgs_in_queue);
        if (msg != nullptr)
        {
            return CURLMultiResponse{ CURLId(msg->easy_handle),
                                      msg->data.result,
                                      msg->msg == CURLMSG_DONE };
        }
        else
        {
            return std::nullopt;
        }
    }

    std::size_t CURLMultiHandle::get_timeout(std::size_t max_timeout) const
    {
        long lmax_timeout = static_cast<long>(max_timeout);
        long curl_timeout = -1;  // NOLINT(runtime/int)
        CURLMcode code = curl_multi_timeout(p_handle, &curl_timeout);
        if (code != CURLM_OK)
        {
            throw curl_error(curl_multi_strerror(code));
        }

        if (curl_timeout < 0 || curl_timeout > lmax_timeout)
        {
            curl_timeout = lmax_timeout;
        }
        return static_cast<std::size_t>(curl_timeout);
    }

    std::size_t CURLMultiHandle::wait(size_t timeout)
    {
        int numfds = 0;
        CURLMcode code = curl_multi_wait(p_handle, NULL, 0, static_cast<int>(timeout), &numfds);
        if (code != CURLM_OK)
        {
            throw curl_error(curl_multi_strerror(code));
        }
        return static_cast<std::size_t>(numfds);
    }
}
