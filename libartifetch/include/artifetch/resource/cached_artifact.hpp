// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_RESOURCE_CACHED_ARTIFACT_HPP
#define ARTIFETCH_RESOURCE_CACHED_ARTIFACT_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace artifetch::resource
{
    /** Identifies the artifact a remote resource is expected to hold, e.g. ``group:name:version``. */
    struct ArtifactIdentity
    {
        std::string key = "";

        auto operator<=>(const ArtifactIdentity&) const = default;
    };

    /** A local file previously downloaded, with its known SHA-1 digest. */
    struct CachedArtifact
    {
        std::string sha1 = "";
        std::filesystem::path path = {};
        std::int64_t size = 0;

        /** Describe an existing file, recording its current size. */
        static auto from_file(std::filesystem::path path, std::string sha1) -> CachedArtifact;
    };

    /** Lookup of local copies possibly holding the content of a remote artifact. */
    class ExternalArtifactCache
    {
    public:

        virtual ~ExternalArtifactCache() = default;

        /** Append the cached artifacts that may match @p identity to @p candidates. */
        virtual void add_matching_cached_artifacts(
            const ArtifactIdentity& identity,
            std::vector<CachedArtifact>& candidates
        ) const = 0;
    };

    class InMemoryArtifactCache final : public ExternalArtifactCache
    {
    public:

        void add(const ArtifactIdentity& identity, CachedArtifact artifact);

        void add_matching_cached_artifacts(
            const ArtifactIdentity& identity,
            std::vector<CachedArtifact>& candidates
        ) const override;

    private:

        std::map<ArtifactIdentity, std::vector<CachedArtifact>> m_artifacts;
    };
}

#endif
