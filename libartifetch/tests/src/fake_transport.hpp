// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_TESTS_FAKE_TRANSPORT_HPP
#define ARTIFETCH_TESTS_FAKE_TRANSPORT_HPP

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "artifetch/transport/transport.hpp"
#include "artifetch/transport/transport_client.hpp"
#include "artifetch/util/string.hpp"

namespace artifetchtests
{
    namespace transport = artifetch::transport;

    /** What the fake server answers for a URL. */
    struct FakeReply
    {
        int status = 200;
        std::string status_text = "OK";
        std::string body = "";
        std::vector<std::pair<std::string, std::string>> headers = {};
        bool send_content_length = true;
        /// Fail with an I/O error instead of answering.
        bool fail = false;
        /// Fail with an I/O error after the first chunk of the body.
        bool fail_body = false;
        std::size_t chunk_size = 4;
    };

    struct RecordedRequest
    {
        transport::HttpVerb verb = transport::HttpVerb::get;
        std::string url = "";
        transport::HttpMethod::header_list headers = {};
        std::optional<transport::HttpProxy> proxy = std::nullopt;
        const transport::HttpProxy* proxy_address = nullptr;
        transport::PasswordCredentials credentials = {};
        std::string body = "";

        auto header(std::string_view name) const -> std::optional<std::string>
        {
            for (const auto& [key, value] : headers)
            {
                if (artifetch::util::iequals(key, name))
                {
                    return value;
                }
            }
            return std::nullopt;
        }
    };

    /** Scripted server shared between a test and its `FakeTransport`. */
    struct FakeServer
    {
        std::map<std::string, FakeReply> replies = {};
        std::vector<RecordedRequest> requests = {};
        std::size_t opened_responses = 0;
        std::size_t released_responses = 0;

        void reply(const std::string& url, FakeReply answer)
        {
            replies[url] = std::move(answer);
        }

        auto requests_to(const std::string& url) const -> std::size_t
        {
            return static_cast<std::size_t>(std::count_if(
                requests.cbegin(),
                requests.cend(),
                [&](const RecordedRequest& request) { return request.url == url; }
            ));
        }

        auto open_responses() const -> std::size_t
        {
            return opened_responses - released_responses;
        }
    };

    class FakeResponse final : public transport::HttpResponse
    {
    public:

        FakeResponse(std::shared_ptr<FakeServer> server, FakeReply reply, bool has_body)
            : p_server(std::move(server))
            , m_reply(std::move(reply))
            , m_has_body(has_body)
        {
            ++p_server->opened_responses;
        }

        ~FakeResponse() override
        {
            release();
        }

        int status_code() const override
        {
            return m_reply.status;
        }

        std::string status_text() const override
        {
            return m_reply.status_text;
        }

        std::optional<std::int64_t> content_length() const override
        {
            if (!m_reply.send_content_length)
            {
                return std::nullopt;
            }
            return static_cast<std::int64_t>(m_reply.body.size());
        }

        std::optional<std::string> header(std::string_view name) const override
        {
            for (const auto& [key, value] : m_reply.headers)
            {
                if (artifetch::util::iequals(key, name))
                {
                    return value;
                }
            }
            return std::nullopt;
        }

        void read_body(const transport::body_sink_t& sink) override
        {
            if (m_released)
            {
                throw std::runtime_error("Response already released");
            }
            if (!m_has_body)
            {
                return;
            }
            const auto& body = m_reply.body;
            for (std::size_t pos = 0; pos < body.size(); pos += m_reply.chunk_size)
            {
                if (m_reply.fail_body && pos > 0)
                {
                    throw std::runtime_error("Connection reset by peer");
                }
                const auto size = std::min(m_reply.chunk_size, body.size() - pos);
                sink(body.data() + pos, size);
            }
        }

        void release() override
        {
            if (!m_released)
            {
                m_released = true;
                ++p_server->released_responses;
            }
        }

    private:

        std::shared_ptr<FakeServer> p_server;
        FakeReply m_reply;
        bool m_has_body;
        bool m_released = false;
    };

    class FakeTransport final : public transport::Transport
    {
    public:

        explicit FakeTransport(std::shared_ptr<FakeServer> server)
            : p_server(std::move(server))
        {
        }

        auto execute(const transport::HttpMethod& method, const transport::TransportState& state)
            -> std::unique_ptr<transport::HttpResponse> override
        {
            RecordedRequest record;
            record.verb = method.verb();
            record.url = method.url();
            record.headers = method.request_headers();
            record.credentials = state.credentials;
            record.proxy_address = state.proxy.proxy();
            if (state.proxy.proxy())
            {
                record.proxy = *state.proxy.proxy();
            }
            if (auto* body = method.request_body())
            {
                body->open();
                char buffer[3];
                for (auto count = body->read(buffer, sizeof(buffer)); count > 0;
                     count = body->read(buffer, sizeof(buffer)))
                {
                    record.body.append(buffer, count);
                }
                body->close();
            }
            p_server->requests.push_back(record);

            auto it = p_server->replies.find(method.url());
            auto reply = (it != p_server->replies.end())
                             ? it->second
                             : FakeReply{ .status = 404, .status_text = "Not Found" };
            if (reply.fail)
            {
                throw std::runtime_error("Connection refused");
            }
            return std::make_unique<FakeResponse>(
                p_server,
                std::move(reply),
                method.verb() == transport::HttpVerb::get
            );
        }

    private:

        std::shared_ptr<FakeServer> p_server;
    };

    inline auto make_fake_client(
        std::shared_ptr<FakeServer> server,
        transport::PasswordCredentials credentials = {},
        std::unique_ptr<transport::ProxySettings> proxy_settings = nullptr
    ) -> std::unique_ptr<transport::TransportClient>
    {
        return std::make_unique<transport::TransportClient>(
            std::make_unique<FakeTransport>(std::move(server)),
            std::move(credentials),
            std::move(proxy_settings)
        );
    }
}

#endif
