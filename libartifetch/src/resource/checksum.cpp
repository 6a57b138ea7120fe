// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "artifetch/core/logging.hpp"
#include "artifetch/core/util_scope.hpp"
#include "artifetch/resource/checksum.hpp"
#include "artifetch/transport/transport_client.hpp"
#include "artifetch/util/string.hpp"

namespace artifetch::resource
{
    auto canonicalize_checksum(std::string_view content, const ChecksumFormat& format)
        -> std::optional<std::string>
    {
        const auto tokens = util::split_whitespace(util::strip(content));
        if (tokens.empty())
        {
            return std::nullopt;
        }

        std::string digest;
        if (format.accept_colon_prefixed && tokens.size() > 1 && util::ends_with(tokens.front(), ':'))
        {
            // "b.jar: 1a2b3c4d 5e6f..."
            for (auto it = tokens.cbegin() + 1; it != tokens.cend(); ++it)
            {
                digest += *it;
            }
        }
        else if (format.strip_trailing_content || tokens.size() == 1)
        {
            // "1a2b3c4d5e6f...  b.jar"
            digest = tokens.front();
        }
        else
        {
            return std::nullopt;
        }

        if (!util::is_hex_string(digest))
        {
            return std::nullopt;
        }
        return digest;
    }

    ChecksumMatcher::ChecksumMatcher(transport::TransportClient& client, ChecksumFormat format)
        : p_client(&client)
        , m_format(std::move(format))
    {
    }

    auto ChecksumMatcher::checksum_url(std::string_view source_url) const -> std::string
    {
        return util::concat(source_url, m_format.extension);
    }

    auto ChecksumMatcher::format() const -> const ChecksumFormat&
    {
        return m_format;
    }

    auto ChecksumMatcher::download_checksum(const std::string& checksum_url) -> expected_t<std::string>
    {
        transport::HttpMethod method(transport::HttpVerb::get, checksum_url);
        on_scope_exit release{ [&method] { method.release_connection(); } };

        try
        {
            const int status = p_client->execute(method);
            if (transport::was_successful(status))
            {
                if (auto digest = canonicalize_checksum(method.response_body_as_string(), m_format))
                {
                    return *digest;
                }
                return make_unexpected(
                    fmt::format("Checksum at {} could not be parsed", checksum_url),
                    artifetch_error_code::unknown
                );
            }
            if (status != 404)
            {
                LOG_INFO << fmt::format(
                    "Request for checksum at {} failed: {} {}",
                    checksum_url,
                    status,
                    method.status_text()
                );
            }
            return make_unexpected(
                fmt::format("Checksum at {} returned status {}", checksum_url, status),
                artifetch_error_code::server_error
            );
        }
        catch (const artifetch_error& ex)
        {
            if (ex.error_code() != artifetch_error_code::transport_failure)
            {
                throw;
            }
            LOG_WARNING << fmt::format("Checksum missing at {} due to: {}", checksum_url, ex.what());
            return tl::make_unexpected(ex);
        }
    }

    auto ChecksumMatcher::try_match(const std::string& source_url, const std::vector<CachedArtifact>& candidates)
        -> std::optional<CachedResource>
    {
        const auto url = checksum_url(source_url);
        const auto sha1 = download_checksum(url);
        if (!sha1)
        {
            LOG_INFO << "Checksum sha1 unavailable. [HTTP GET: " << url << "]";
            return std::nullopt;
        }

        for (const auto& candidate : candidates)
        {
            if (candidate.sha1 == sha1.value())
            {
                LOG_INFO << "Checksum sha1 matched cached resource: [HTTP GET: " << url << "]";
                return CachedResource(source_url, candidate);
            }
        }
        LOG_INFO << "Checksum sha1 did not match cached resources: [HTTP GET: " << url << "]";
        return std::nullopt;
    }
}
