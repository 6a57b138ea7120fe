// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_TRANSPORT_HTTP_METHOD_HPP
#define ARTIFETCH_TRANSPORT_HTTP_METHOD_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace artifetch::transport
{
    enum class HttpVerb
    {
        get,
        head,
        put
    };

    /// @returns The HTTP method name, "GET", "HEAD" or "PUT".
    auto name_of(HttpVerb verb) -> const char*;

    /** Callback receiving the successive chunks of a response body. */
    using body_sink_t = std::function<void(const char* data, std::size_t size)>;

    /*****************
     *  RequestBody  *
     *****************/

    /**
     * Body sent along a request.
     *
     * The transport calls `open` once before sending, then `read` until it returns 0,
     * then `close`.
     */
    class RequestBody
    {
    public:

        virtual ~RequestBody() = default;

        virtual std::int64_t content_length() const = 0;
        virtual std::string content_type() const = 0;
        virtual bool is_repeatable() const = 0;

        virtual void open() = 0;
        virtual std::size_t read(char* buffer, std::size_t size) = 0;
        virtual void close() = 0;

    protected:

        RequestBody() = default;
        RequestBody(const RequestBody&) = default;
        RequestBody& operator=(const RequestBody&) = default;
    };

    /**
     * Non repeatable body streaming the content of a local file as
     * ``application/octet-stream``.
     */
    class FileRequestBody final : public RequestBody
    {
    public:

        using chunk_callback_t = std::function<void(std::size_t)>;

        explicit FileRequestBody(std::filesystem::path source, chunk_callback_t on_chunk = {});
        ~FileRequestBody() override;

        std::int64_t content_length() const override;
        std::string content_type() const override;
        bool is_repeatable() const override;

        void open() override;
        std::size_t read(char* buffer, std::size_t size) override;
        void close() override;

        bool is_open() const;

    private:

        std::filesystem::path m_source;
        chunk_callback_t m_on_chunk;
        std::ifstream m_stream;
        bool m_consumed = false;
    };

    /******************
     *  HttpResponse  *
     ******************/

    /**
     * Response of an executed request, as returned by a `Transport`.
     *
     * The status and the headers are available as soon as the response is created,
     * the body is only transferred when `read_body` is called.
     */
    class HttpResponse
    {
    public:

        virtual ~HttpResponse() = default;

        HttpResponse(const HttpResponse&) = delete;
        HttpResponse& operator=(const HttpResponse&) = delete;

        virtual int status_code() const = 0;
        virtual std::string status_text() const = 0;
        virtual std::optional<std::int64_t> content_length() const = 0;
        virtual std::optional<std::string> header(std::string_view name) const = 0;

        /** Stream the body to @p sink, can only be called once. */
        virtual void read_body(const body_sink_t& sink) = 0;

        /** Close the underlying connection, abandonning any unread body. */
        virtual void release() = 0;

    protected:

        HttpResponse() = default;
    };

    /****************
     *  HttpMethod  *
     ****************/

    class HttpMethod;

    /**
     * Decide whether a request failing with an I/O error must be executed again.
     *
     * @param execution_count Number of times the request has been executed so far.
     */
    using retry_handler_t = std::function<
        bool(const HttpMethod& method, const std::exception& error, std::size_t execution_count)>;

    /** A retry handler always declining to retry. */
    auto no_retry_handler() -> retry_handler_t;

    /**
     * A request and, once executed, its response.
     *
     * The connection of the response is released on destruction if it was not done
     * explicitly before.
     */
    class HttpMethod
    {
    public:

        using header_list = std::vector<std::pair<std::string, std::string>>;

        HttpMethod(HttpVerb verb, std::string url);
        ~HttpMethod();

        HttpMethod(const HttpMethod&) = delete;
        HttpMethod& operator=(const HttpMethod&) = delete;
        HttpMethod(HttpMethod&&) noexcept;
        HttpMethod& operator=(HttpMethod&&) noexcept;

        HttpVerb verb() const;
        const std::string& url() const;

        /** Set a request header, replacing any header with the same (case insensitive) name. */
        void set_request_header(std::string name, std::string value);
        const header_list& request_headers() const;
        std::optional<std::string> request_header(std::string_view name) const;

        void set_retry_handler(retry_handler_t handler);
        const retry_handler_t& retry_handler() const;

        void set_request_body(std::unique_ptr<RequestBody> body);
        RequestBody* request_body() const;

        /** Attach the response of the execution, used by the transport client. */
        void set_response(std::unique_ptr<HttpResponse> response);
        bool is_executed() const;

        int status_code() const;
        std::string status_text() const;
        std::optional<std::int64_t> response_content_length() const;
        std::optional<std::string> response_header(std::string_view name) const;

        /** Read the whole response body in memory. */
        std::string response_body_as_string();

        /** Stream the response body to @p sink. */
        void write_response_body(const body_sink_t& sink);

        /** Release the connection of the response, only the first call has an effect. */
        void release_connection();
        bool is_released() const;

    private:

        const HttpResponse& response() const;
        HttpResponse& response();

        HttpVerb m_verb;
        std::string m_url;
        header_list m_headers;
        retry_handler_t m_retry_handler;
        std::unique_ptr<RequestBody> p_body;
        std::unique_ptr<HttpResponse> p_response;
        bool m_released = false;
    };

    /** Whether an HTTP status code is a success, i.e. 2xx. */
    bool was_successful(int status_code);
}

#endif
