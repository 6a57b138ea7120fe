// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>

#include <fmt/format.h>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/logging.hpp"
#include "artifetch/transport/http_method.hpp"
#include "artifetch/util/string.hpp"
#include "artifetch/util/url.hpp"

namespace artifetch::transport
{
    auto name_of(HttpVerb verb) -> const char*
    {
        switch (verb)
        {
            case HttpVerb::get:
                return "GET";
            case HttpVerb::head:
                return "HEAD";
            case HttpVerb::put:
                return "PUT";
        }
        return "GET";
    }

    bool was_successful(int status_code)
    {
        return status_code >= 200 && status_code < 300;
    }

    /*********************
     *  FileRequestBody  *
     *********************/

    FileRequestBody::FileRequestBody(std::filesystem::path source, chunk_callback_t on_chunk)
        : m_source(std::move(source))
        , m_on_chunk(std::move(on_chunk))
    {
    }

    FileRequestBody::~FileRequestBody()
    {
        close();
    }

    std::int64_t FileRequestBody::content_length() const
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(m_source, ec);
        return ec ? -1 : static_cast<std::int64_t>(size);
    }

    std::string FileRequestBody::content_type() const
    {
        return "application/octet-stream";
    }

    bool FileRequestBody::is_repeatable() const
    {
        return false;
    }

    void FileRequestBody::open()
    {
        if (m_consumed)
        {
            throw artifetch_error(
                fmt::format("Request body from '{}' cannot be sent twice", m_source.string()),
                artifetch_error_code::precondition_violation
            );
        }
        m_stream.open(m_source, std::ios::in | std::ios::binary);
        if (!m_stream.is_open())
        {
            throw artifetch_error(
                fmt::format("Could not open '{}' for reading", m_source.string()),
                artifetch_error_code::io_error
            );
        }
        m_consumed = true;
    }

    std::size_t FileRequestBody::read(char* buffer, std::size_t size)
    {
        if (!m_stream.is_open())
        {
            return 0;
        }
        m_stream.read(buffer, static_cast<std::streamsize>(size));
        if (m_stream.bad())
        {
            throw artifetch_error(
                fmt::format("Could not read '{}'", m_source.string()),
                artifetch_error_code::io_error
            );
        }
        const auto count = static_cast<std::size_t>(m_stream.gcount());
        if (count > 0 && m_on_chunk)
        {
            m_on_chunk(count);
        }
        return count;
    }

    void FileRequestBody::close()
    {
        if (m_stream.is_open())
        {
            m_stream.close();
        }
    }

    bool FileRequestBody::is_open() const
    {
        return m_stream.is_open();
    }

    /****************
     *  HttpMethod  *
     ****************/

    auto no_retry_handler() -> retry_handler_t
    {
        return [](const HttpMethod&, const std::exception&, std::size_t) { return false; };
    }

    HttpMethod::HttpMethod(HttpVerb verb, std::string url)
        : m_verb(verb)
        , m_url(std::move(url))
    {
    }

    HttpMethod::~HttpMethod()
    {
        release_connection();
    }

    HttpMethod::HttpMethod(HttpMethod&& rhs) noexcept
        : m_verb(rhs.m_verb)
        , m_url(std::move(rhs.m_url))
        , m_headers(std::move(rhs.m_headers))
        , m_retry_handler(std::move(rhs.m_retry_handler))
        , p_body(std::move(rhs.p_body))
        , p_response(std::move(rhs.p_response))
        , m_released(rhs.m_released)
    {
        rhs.m_released = true;
    }

    HttpMethod& HttpMethod::operator=(HttpMethod&& rhs) noexcept
    {
        if (this != &rhs)
        {
            release_connection();
            m_verb = rhs.m_verb;
            m_url = std::move(rhs.m_url);
            m_headers = std::move(rhs.m_headers);
            m_retry_handler = std::move(rhs.m_retry_handler);
            p_body = std::move(rhs.p_body);
            p_response = std::move(rhs.p_response);
            m_released = rhs.m_released;
            rhs.m_released = true;
        }
        return *this;
    }

    HttpVerb HttpMethod::verb() const
    {
        return m_verb;
    }

    const std::string& HttpMethod::url() const
    {
        return m_url;
    }

    void HttpMethod::set_request_header(std::string name, std::string value)
    {
        auto it = std::find_if(
            m_headers.begin(),
            m_headers.end(),
            [&](const auto& header) { return util::iequals(header.first, name); }
        );
        if (it != m_headers.end())
        {
            it->second = std::move(value);
        }
        else
        {
            m_headers.emplace_back(std::move(name), std::move(value));
        }
    }

    auto HttpMethod::request_headers() const -> const header_list&
    {
        return m_headers;
    }

    std::optional<std::string> HttpMethod::request_header(std::string_view name) const
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

    void HttpMethod::set_retry_handler(retry_handler_t handler)
    {
        m_retry_handler = std::move(handler);
    }

    const retry_handler_t& HttpMethod::retry_handler() const
    {
        return m_retry_handler;
    }

    void HttpMethod::set_request_body(std::unique_ptr<RequestBody> body)
    {
        p_body = std::move(body);
    }

    RequestBody* HttpMethod::request_body() const
    {
        return p_body.get();
    }

    void HttpMethod::set_response(std::unique_ptr<HttpResponse> response)
    {
        p_response = std::move(response);
        m_released = false;
    }

    bool HttpMethod::is_executed() const
    {
        return p_response != nullptr;
    }

    int HttpMethod::status_code() const
    {
        return response().status_code();
    }

    std::string HttpMethod::status_text() const
    {
        return response().status_text();
    }

    std::optional<std::int64_t> HttpMethod::response_content_length() const
    {
        return response().content_length();
    }

    std::optional<std::string> HttpMethod::response_header(std::string_view name) const
    {
        return response().header(name);
    }

    std::string HttpMethod::response_body_as_string()
    {
        std::string body;
        write_response_body([&body](const char* data, std::size_t size) { body.append(data, size); });
        return body;
    }

    void HttpMethod::write_response_body(const body_sink_t& sink)
    {
        if (m_released)
        {
            throw artifetch_error(
                fmt::format("Connection to '{}' already released", util::hide_secrets(m_url)),
                artifetch_error_code::precondition_violation
            );
        }
        try
        {
            response().read_body(sink);
        }
        catch (const artifetch_error&)
        {
            throw;
        }
        catch (const std::exception& ex)
        {
            throw artifetch_error(
                fmt::format(
                    "Could not read response of {} '{}'. {}",
                    name_of(m_verb),
                    util::hide_secrets(m_url),
                    ex.what()
                ),
                artifetch_error_code::transport_failure,
                std::current_exception()
            );
        }
    }

    void HttpMethod::release_connection()
    {
        if (p_response && !m_released)
        {
            m_released = true;
            p_response->release();
            LOG_TRACE << "Released connection [HTTP " << name_of(m_verb) << ": " << m_url << "]";
        }
    }

    bool HttpMethod::is_released() const
    {
        return m_released;
    }

    const HttpResponse& HttpMethod::response() const
    {
        if (!p_response)
        {
            throw artifetch_error(
                fmt::format(
                    "HTTP {} '{}' has not been executed",
                    name_of(m_verb),
                    util::hide_secrets(m_url)
                ),
                artifetch_error_code::precondition_violation
            );
        }
        return *p_response;
    }

    HttpResponse& HttpMethod::response()
    {
        return const_cast<HttpResponse&>(std::as_const(*this).response());
    }
}
