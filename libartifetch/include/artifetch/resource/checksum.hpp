// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_RESOURCE_CHECKSUM_HPP
#define ARTIFETCH_RESOURCE_CHECKSUM_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/resource/cached_artifact.hpp"
#include "artifetch/resource/resource.hpp"

namespace artifetch::transport
{
    class TransportClient;
}

namespace artifetch::resource
{
    /** How checksum side-files are located and read. */
    struct ChecksumFormat
    {
        /// Suffix appended to a resource URL to get its checksum.
        std::string extension = ".sha1";
        /// Keep only the first token of the file, dropping a trailing file name.
        bool strip_trailing_content = true;
        /// Accept ``name: hex groups`` files, the groups being joined.
        bool accept_colon_prefixed = true;
    };

    /**
     * Extract the hexadecimal digest from the content of a checksum file.
     *
     * @returns The digest, or nothing if the content does not hold one.
     */
    auto canonicalize_checksum(std::string_view content, const ChecksumFormat& format = {})
        -> std::optional<std::string>;

    /**
     * Match a remote resource with local candidates by comparing the digest
     * published next to it.
     */
    class ChecksumMatcher
    {
    public:

        explicit ChecksumMatcher(transport::TransportClient& client, ChecksumFormat format = {});

        /**
         * Fetch the checksum of @p source_url and return the first candidate
         * with the same digest.
         *
         * A checksum that cannot be fetched or read results in no match.
         */
        auto try_match(const std::string& source_url, const std::vector<CachedArtifact>& candidates)
            -> std::optional<CachedResource>;

        /** Fetch and canonicalize the checksum file at @p checksum_url. */
        auto download_checksum(const std::string& checksum_url) -> expected_t<std::string>;

        [[nodiscard]] auto checksum_url(std::string_view source_url) const -> std::string;
        [[nodiscard]] auto format() const -> const ChecksumFormat&;

    private:

        transport::TransportClient* p_client;
        ChecksumFormat m_format;
    };
}

#endif
