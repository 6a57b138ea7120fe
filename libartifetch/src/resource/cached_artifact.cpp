// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/resource/cached_artifact.hpp"

namespace artifetch::resource
{
    auto CachedArtifact::from_file(std::filesystem::path path, std::string sha1) -> CachedArtifact
    {
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec)
        {
            throw artifetch_error(
                fmt::format("Could not read size of '{}': {}", path.string(), ec.message()),
                artifetch_error_code::io_error
            );
        }
        return { std::move(sha1), std::move(path), static_cast<std::int64_t>(size) };
    }

    void InMemoryArtifactCache::add(const ArtifactIdentity& identity, CachedArtifact artifact)
    {
        m_artifacts[identity].push_back(std::move(artifact));
    }

    void InMemoryArtifactCache::add_matching_cached_artifacts(
        const ArtifactIdentity& identity,
        std::vector<CachedArtifact>& candidates
    ) const
    {
        if (auto it = m_artifacts.find(identity); it != m_artifacts.end())
        {
            candidates.insert(candidates.end(), it->second.cbegin(), it->second.cend());
        }
    }
}
