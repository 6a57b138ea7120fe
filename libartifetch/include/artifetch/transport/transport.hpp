// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_TRANSPORT_TRANSPORT_HPP
#define ARTIFETCH_TRANSPORT_TRANSPORT_HPP

#include <memory>

#include "artifetch/transport/http_method.hpp"
#include "artifetch/transport/parameters.hpp"
#include "artifetch/transport/proxy.hpp"

namespace artifetch::transport
{
    /** Connection state shared by all the requests of a client. */
    struct TransportState
    {
        PasswordCredentials credentials = {};
        ProxyState proxy = {};
    };

    /**
     * Low level HTTP transport.
     *
     * `execute` sends the request and returns once the response status and headers
     * are known. It throws on I/O failures, HTTP error statuses are not errors.
     */
    class Transport
    {
    public:

        virtual ~Transport() = default;

        virtual auto execute(const HttpMethod& method, const TransportState& state)
            -> std::unique_ptr<HttpResponse> = 0;

    protected:

        Transport() = default;
        Transport(const Transport&) = default;
        Transport& operator=(const Transport&) = default;
    };

    /** Create a `Transport` implemented with libcurl. */
    auto make_curl_transport(RemoteFetchParams params) -> std::unique_ptr<Transport>;
}

#endif
