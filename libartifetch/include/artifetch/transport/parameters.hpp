// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_TRANSPORT_PARAMETERS_HPP
#define ARTIFETCH_TRANSPORT_PARAMETERS_HPP

#include <map>
#include <string>
#include <vector>

namespace artifetch::transport
{
    struct PasswordCredentials
    {
        std::string username = "";
        std::string password = "";

        /** Credentials are only used when a username is given. */
        [[nodiscard]] bool has_username() const
        {
            return !username.empty();
        }
    };

    struct RemoteFetchParams
    {
        // ssl_verify can be either an empty string (regular SSL verification),
        // the string "<false>" to indicate no SSL verification, or a path to
        // a cert file.
        std::string ssl_verify = "";
        bool ssl_no_revoke = false;

        // Empty means the default ``artifetch/<version>``.
        std::string user_agent = "";

        double connect_timeout_secs = 10.;
        // Abort transfers slower than 30 bytes/s during 60 seconds.
        bool set_low_speed_opt = true;
        // Forward libcurl verbose output to the libcurl logger.
        bool verbose = false;

        PasswordCredentials credentials = {};

        // Keys are "scheme://host", "scheme", "all://host" or "all", values are proxy URLs.
        std::map<std::string, std::string> proxy_servers = {};
        // Hosts never accessed through a proxy, either exact names or ".domain" suffixes.
        std::vector<std::string> no_proxy = {};
    };
}
#endif
