// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <exception>
#include <stdexcept>

#include <fmt/format.h>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/logging.hpp"
#include "artifetch/transport/transport_client.hpp"
#include "artifetch/util/url.hpp"
#include "artifetch/version.hpp"

namespace artifetch::transport
{
    TransportClient::TransportClient(
        std::unique_ptr<Transport> transport,
        PasswordCredentials credentials,
        std::unique_ptr<ProxySettings> proxy_settings,
        std::string user_agent
    )
        : p_transport(std::move(transport))
        , m_proxy_resolver(std::move(proxy_settings))
        , m_user_agent(user_agent.empty() ? artifetch::user_agent() : std::move(user_agent))
    {
        if (!p_transport)
        {
            throw std::invalid_argument("TransportClient requires a transport");
        }
        m_state.credentials = std::move(credentials);
    }

    void TransportClient::configure_method(HttpMethod& method) const
    {
        method.set_request_header("User-Agent", m_user_agent);
        // Content must be saved as sent, without transparent decompression.
        method.set_request_header("Accept-Encoding", "identity");
        method.set_retry_handler(no_retry_handler());
    }

    int TransportClient::execute(HttpMethod& method)
    {
        configure_method(method);
        m_proxy_resolver.resolve_for(method.url(), m_state.proxy);

        const auto& retry = method.retry_handler();
        for (std::size_t execution_count = 1;; ++execution_count)
        {
            try
            {
                LOG_DEBUG << "Performing HTTP " << name_of(method.verb()) << ": " << method.url();
                method.set_response(p_transport->execute(method, m_state));
                break;
            }
            catch (const std::exception& ex)
            {
                if (retry && retry(method, ex, execution_count))
                {
                    LOG_DEBUG << "Retrying HTTP " << name_of(method.verb()) << ": " << method.url();
                    continue;
                }
                throw artifetch_error(
                    fmt::format(
                        "Could not {} '{}'. {}",
                        name_of(method.verb()),
                        util::hide_secrets(method.url()),
                        ex.what()
                    ),
                    artifetch_error_code::transport_failure,
                    std::current_exception()
                );
            }
        }

        const int status = method.status_code();
        LOG_DEBUG << "Response " << status << " [HTTP " << name_of(method.verb()) << ": "
                  << method.url() << "]";
        return status;
    }

    const TransportState& TransportClient::state() const
    {
        return m_state;
    }

    const ProxyResolver& TransportClient::proxy_resolver() const
    {
        return m_proxy_resolver;
    }

    const std::string& TransportClient::user_agent() const
    {
        return m_user_agent;
    }
}
