// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "artifetch/core/logging.hpp"
#include "artifetch/core/util_scope.hpp"
#include "artifetch/transport/transport.hpp"
#include "artifetch/util/string.hpp"
#include "artifetch/util/url.hpp"

#include "curl.hpp"

namespace artifetch::transport
{
    namespace
    {
        int log_curl_debug(CURL* /* handle */, curl_infotype type, char* data, size_t size, void*)
        {
            const auto text = util::rstrip(std::string_view(data, size));
            const char* prefix = nullptr;
            switch (type)
            {
                case CURLINFO_TEXT:
                    prefix = "*";
                    break;
                case CURLINFO_HEADER_OUT:
                    prefix = ">";
                    break;
                case CURLINFO_HEADER_IN:
                    prefix = "<";
                    break;
                default:
                    return 0;
            }
            logging::log({
                .message = util::hide_secrets(fmt::format("{} {}", prefix, text)),
                .level = log_level::info,
                .source = log_source::libcurl,
            });
            return 0;
        }

        /**
         * A response being transferred by libcurl.
         *
         * The transfer is driven by a dedicated multi handle. GET transfers are paused
         * on the first body chunk until `read_body` provides a sink, other transfers
         * complete when the response is created.
         */
        class CurlResponse final : public HttpResponse
        {
        public:

            CurlResponse(const HttpMethod& method, const TransportState& state, const RemoteFetchParams& params);
            ~CurlResponse() override;

            void start();

            int status_code() const override;
            std::string status_text() const override;
            std::optional<std::int64_t> content_length() const override;
            std::optional<std::string> header(std::string_view name) const override;

            void read_body(const body_sink_t& sink) override;
            void release() override;

        private:

            static std::size_t curl_header_callback(char* buffer, std::size_t size, std::size_t nitems, void* self);
            static std::size_t curl_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* self);
            static std::size_t curl_read_callback(char* buffer, std::size_t size, std::size_t nitems, void* self);

            void configure(const HttpMethod& method, const TransportState& state, const RemoteFetchParams& params);
            void pump();
            void throw_if_failed();

            CURLHandle m_handle;
            CURLMultiHandle m_multi;
            std::string m_url;
            HttpVerb m_verb;
            RequestBody* p_request_body = nullptr;
            const body_sink_t* p_sink = nullptr;

            std::string m_status_line;
            std::vector<std::pair<std::string, std::string>> m_headers;
            std::string m_buffered_body;
            std::exception_ptr m_callback_error;
            CURLcode m_result = CURLE_OK;

            bool m_attached = false;
            bool m_done = false;
            bool m_paused = false;
            bool m_body_read = false;
        };

        CurlResponse::CurlResponse(
            const HttpMethod& method,
            const TransportState& state,
            const RemoteFetchParams& params
        )
            : m_multi(1)
            , m_url(method.url())
            , m_verb(method.verb())
            , p_request_body(method.request_body())
        {
            configure(method, state, params);
        }

        CurlResponse::~CurlResponse()
        {
            release();
        }

        void CurlResponse::configure(
            const HttpMethod& method,
            const TransportState& state,
            const RemoteFetchParams& params
        )
        {
            m_handle.configure_handle(
                m_url,
                params.set_low_speed_opt,
                params.connect_timeout_secs,
                params.ssl_no_revoke,
                params.ssl_verify
            );

            m_handle.set_opt(CURLOPT_HEADERFUNCTION, &CurlResponse::curl_header_callback);
            m_handle.set_opt(CURLOPT_HEADERDATA, this);
            m_handle.set_opt(CURLOPT_WRITEFUNCTION, &CurlResponse::curl_write_callback);
            m_handle.set_opt(CURLOPT_WRITEDATA, this);

            switch (m_verb)
            {
                case HttpVerb::head:
                    m_handle.set_opt(CURLOPT_NOBODY, 1L);
                    break;
                case HttpVerb::put:
                    m_handle.set_opt(CURLOPT_UPLOAD, 1L);
                    m_handle.set_opt(CURLOPT_READFUNCTION, &CurlResponse::curl_read_callback);
                    m_handle.set_opt(CURLOPT_READDATA, this);
                    if (p_request_body)
                    {
                        m_handle.set_opt(
                            CURLOPT_INFILESIZE_LARGE,
                            static_cast<curl_off_t>(p_request_body->content_length())
                        );
                        m_handle.add_header(fmt::format("Content-Type: {}", p_request_body->content_type()));
                    }
                    else
                    {
                        m_handle.set_opt(CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
                    }
                    break;
                case HttpVerb::get:
                    m_handle.set_opt(CURLOPT_HTTPGET, 1L);
                    break;
            }

            for (const auto& [name, value] : method.request_headers())
            {
                m_handle.add_header(fmt::format("{}: {}", name, value));
            }
            m_handle.set_opt_header();

            if (state.credentials.has_username())
            {
                // Credentials are sent with the first request, without waiting for a challenge.
                m_handle.set_opt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC));
                m_handle.set_opt(CURLOPT_USERNAME, state.credentials.username);
                m_handle.set_opt(CURLOPT_PASSWORD, state.credentials.password);
            }

            if (const HttpProxy* proxy = state.proxy.proxy())
            {
                m_handle.set_opt(CURLOPT_PROXY, proxy->url());
                if (proxy->username)
                {
                    m_handle.set_opt(CURLOPT_PROXYUSERNAME, *proxy->username);
                    m_handle.set_opt(CURLOPT_PROXYPASSWORD, proxy->password.value_or(""));
                }
            }
            else
            {
                // An empty proxy disables the proxies from the environment.
                m_handle.set_opt(CURLOPT_PROXY, std::string());
            }

            if (params.verbose)
            {
                m_handle.set_opt(CURLOPT_VERBOSE, 1L);
                m_handle.set_opt(CURLOPT_DEBUGFUNCTION, &log_curl_debug);
            }
        }

        void CurlResponse::start()
        {
            if (p_request_body)
            {
                p_request_body->open();
            }
            on_scope_exit close_body{ [this]
                                      {
                                          if (p_request_body)
                                          {
                                              p_request_body->close();
                                          }
                                      } };

            m_multi.add_handle(m_handle);
            m_attached = true;
            pump();
            if (m_done)
            {
                throw_if_failed();
            }
            else if (m_verb != HttpVerb::get)
            {
                throw curl_error(fmt::format("Transfer of '{}' did not complete", util::hide_secrets(m_url)));
            }
        }

        void CurlResponse::pump()
        {
            while (!m_done && !m_paused)
            {
                m_multi.perform();
                while (auto msg = m_multi.pop_message())
                {
                    if (msg->m_transfer_done && msg->m_handle_id == m_handle.get_id())
                    {
                        m_done = true;
                        m_result = msg->m_transfer_result;
                    }
                }
                if (!m_done && !m_paused)
                {
                    m_multi.wait(m_multi.get_timeout());
                }
            }
        }

        void CurlResponse::throw_if_failed()
        {
            if (m_callback_error)
            {
                std::rethrow_exception(std::exchange(m_callback_error, nullptr));
            }
            if (!CURLHandle::is_curl_res_ok(m_result))
            {
                const std::string details = m_handle.get_error_buffer();
                throw curl_error(
                    details.empty() ? CURLHandle::get_res_error(m_result)
                                    : fmt::format("{} ({})", CURLHandle::get_res_error(m_result), details),
                    m_result
                );
            }
        }

        int CurlResponse::status_code() const
        {
            return m_handle.get_info<int>(CURLINFO_RESPONSE_CODE).value_or(0);
        }

        std::string CurlResponse::status_text() const
        {
            // "HTTP/1.1 404 Not Found"
            const auto parts = util::split_whitespace(m_status_line);
            std::string text;
            for (std::size_t i = 2; i < parts.size(); ++i)
            {
                if (!text.empty())
                {
                    text += ' ';
                }
                text += parts[i];
            }
            return text;
        }

        std::optional<std::int64_t> CurlResponse::content_length() const
        {
            const auto length = m_handle.get_info<curl_off_t>(CURLINFO_CONTENT_LENGTH_DOWNLOAD_T);
            if (length && length.value() >= 0)
            {
                return static_cast<std::int64_t>(length.value());
            }
            return std::nullopt;
        }

        std::optional<std::string> CurlResponse::header(std::string_view name) const
        {
            for (const auto& [key, value] : m_headers)
            {
                if (util::iequals(key, name))
                {
                    return value;
                }
            }
            return std::nullopt;
        }

        void CurlResponse::read_body(const body_sink_t& sink)
        {
            if (m_body_read)
            {
                throw curl_error(
                    fmt::format("Response body of '{}' already read", util::hide_secrets(m_url))
                );
            }
            m_body_read = true;

            if (m_verb != HttpVerb::get)
            {
                if (!m_buffered_body.empty())
                {
                    sink(m_buffered_body.data(), m_buffered_body.size());
                }
                return;
            }

            p_sink = &sink;
            on_scope_exit reset_sink{ [this] { p_sink = nullptr; } };

            if (m_paused)
            {
                m_paused = false;
                const CURLcode code = m_handle.unpause();
                if (m_callback_error)
                {
                    std::rethrow_exception(std::exchange(m_callback_error, nullptr));
                }
                if (!CURLHandle::is_curl_res_ok(code))
                {
                    throw curl_error(CURLHandle::get_res_error(code), code);
                }
            }
            pump();
            throw_if_failed();
        }

        void CurlResponse::release()
        {
            if (m_attached)
            {
                m_attached = false;
                m_multi.remove_handle(m_handle);
            }
        }

        std::size_t
        CurlResponse::curl_header_callback(char* buffer, std::size_t size, std::size_t nitems, void* self)
        {
            auto* s = static_cast<CurlResponse*>(self);
            const std::size_t buffer_size = size * nitems;
            const auto line = util::strip(std::string_view(buffer, buffer_size));

            if (util::starts_with(line, "HTTP/"))
            {
                // A new response starts, after a redirection or an interim status.
                s->m_status_line = std::string(line);
                s->m_headers.clear();
            }
            else if (const auto colon = line.find(':'); colon != std::string_view::npos)
            {
                s->m_headers.emplace_back(
                    std::string(util::strip(line.substr(0, colon))),
                    std::string(util::strip(line.substr(colon + 1)))
                );
            }
            return buffer_size;
        }

        std::size_t
        CurlResponse::curl_write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* self)
        {
            auto* s = static_cast<CurlResponse*>(self);
            const std::size_t buffer_size = size * nmemb;

            if (s->m_verb != HttpVerb::get)
            {
                s->m_buffered_body.append(ptr, buffer_size);
                return buffer_size;
            }
            if (s->p_sink == nullptr)
            {
                s->m_paused = true;
                return CURL_WRITEFUNC_PAUSE;
            }
            try
            {
                (*s->p_sink)(ptr, buffer_size);
                return buffer_size;
            }
            catch (...)
            {
                // Rethrown from read_body once libcurl aborted the transfer.
                s->m_callback_error = std::current_exception();
                return 0;
            }
        }

        std::size_t
        CurlResponse::curl_read_callback(char* buffer, std::size_t size, std::size_t nitems, void* self)
        {
            auto* s = static_cast<CurlResponse*>(self);
            if (s->p_request_body == nullptr)
            {
                return 0;
            }
            try
            {
                return s->p_request_body->read(buffer, size * nitems);
            }
            catch (...)
            {
                s->m_callback_error = std::current_exception();
                return CURL_READFUNC_ABORT;
            }
        }

        /*******************
         *  CurlTransport  *
         *******************/

        class CurlTransport final : public Transport
        {
        public:

            explicit CurlTransport(RemoteFetchParams params)
                : m_params(std::move(params))
            {
                curl::init_curl_globally();
            }

            auto execute(const HttpMethod& method, const TransportState& state)
                -> std::unique_ptr<HttpResponse> override
            {
                auto response = std::make_unique<CurlResponse>(method, state, m_params);
                response->start();
                return response;
            }

        private:

            RemoteFetchParams m_params;
        };
    }

    auto make_curl_transport(RemoteFetchParams params) -> std::unique_ptr<Transport>
    {
        return std::make_unique<CurlTransport>(std::move(params));
    }
}
