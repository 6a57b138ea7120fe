// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_TRANSPORT_TRANSPORT_CLIENT_HPP
#define ARTIFETCH_TRANSPORT_TRANSPORT_CLIENT_HPP

#include <memory>
#include <string>

#include "artifetch/transport/http_method.hpp"
#include "artifetch/transport/parameters.hpp"
#include "artifetch/transport/proxy.hpp"
#include "artifetch/transport/transport.hpp"

namespace artifetch::transport
{
    /**
     * Execute requests over a `Transport`, with the credentials and the proxy
     * shared by all the requests of a resolver.
     *
     * I/O failures are reported as ``artifetch_error`` with the
     * ``transport_failure`` code, HTTP statuses are returned as is.
     */
    class TransportClient
    {
    public:

        TransportClient(
            std::unique_ptr<Transport> transport,
            PasswordCredentials credentials,
            std::unique_ptr<ProxySettings> proxy_settings,
            std::string user_agent = ""
        );

        TransportClient(const TransportClient&) = delete;
        TransportClient& operator=(const TransportClient&) = delete;

        /**
         * Configure and execute @p method, attaching the response to it.
         *
         * @returns The HTTP status code of the response.
         */
        int execute(HttpMethod& method);

        /** Set the default headers and retry handler on @p method. */
        void configure_method(HttpMethod& method) const;

        [[nodiscard]] const TransportState& state() const;
        [[nodiscard]] const ProxyResolver& proxy_resolver() const;
        [[nodiscard]] const std::string& user_agent() const;

    private:

        std::unique_ptr<Transport> p_transport;
        TransportState m_state;
        ProxyResolver m_proxy_resolver;
        std::string m_user_agent;
    };
}

#endif
