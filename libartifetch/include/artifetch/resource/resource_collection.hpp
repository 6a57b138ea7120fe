// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_RESOURCE_RESOURCE_COLLECTION_HPP
#define ARTIFETCH_RESOURCE_RESOURCE_COLLECTION_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "artifetch/resource/cached_artifact.hpp"
#include "artifetch/resource/checksum.hpp"
#include "artifetch/resource/directory_lister.hpp"
#include "artifetch/resource/resource.hpp"
#include "artifetch/resource/transfer.hpp"
#include "artifetch/transport/transport_client.hpp"

namespace artifetch::resource
{
    struct ResourceCollectionParams
    {
        ChecksumFormat checksum_format = {};
        IndexFormat index_format = {};
    };

    /**
     * Resolve, download and upload resources of an HTTP repository.
     *
     * A GET for a known artifact first compares the checksum published next to the
     * resource with the local candidates of the artifact cache, and only fetches the
     * resource when none matches.
     *
     * Not thread-safe, one operation at a time.
     */
    class HttpResourceCollection
    {
    public:

        /**
         * @param artifact_cache Source of local candidates, may be null. Must outlive
         *        the collection.
         */
        HttpResourceCollection(
            std::unique_ptr<transport::TransportClient> client,
            const ExternalArtifactCache* artifact_cache,
            ResourceCollectionParams params = {}
        );

        HttpResourceCollection(const HttpResourceCollection&) = delete;
        HttpResourceCollection& operator=(const HttpResourceCollection&) = delete;
        HttpResourceCollection(HttpResourceCollection&&) = delete;
        HttpResourceCollection& operator=(HttpResourceCollection&&) = delete;

        /** Get @p source, using a cached copy of @p artifact_id when its checksum matches. */
        auto get_resource(const std::string& source, const std::optional<ArtifactIdentity>& artifact_id)
            -> Resource;

        /** Same as above, but only check for existence with a HEAD when not @p for_download. */
        auto get_resource(
            const std::string& source,
            const std::optional<ArtifactIdentity>& artifact_id,
            bool for_download
        ) -> Resource;

        /** Get @p source, using the first of @p candidates whose checksum matches. */
        auto get_resource(const std::string& source, const std::vector<CachedArtifact>& candidates)
            -> Resource;

        auto head_resource(const std::string& source) -> Resource;

        /**
         * Write @p resource to @p destination, reporting the transfer to the listeners.
         *
         * @throws artifetch_error with ``precondition_violation`` for a missing resource.
         */
        void download_resource(Resource& resource, const std::filesystem::path& destination);

        /** Get @p source without cache lookup and write it to @p destination. */
        void get(const std::string& source, const std::filesystem::path& destination);

        /** Upload the regular file @p source to @p destination. */
        void put(const std::filesystem::path& source, const std::string& destination);

        auto list(const std::string& parent) -> std::optional<std::vector<std::string>>;

        void add_transfer_listener(TransferListener& listener);
        void remove_transfer_listener(const TransferListener& listener);
        [[nodiscard]] bool has_transfer_listener(const TransferListener& listener) const;

        [[nodiscard]] auto progress() const -> const TransferProgress&;
        [[nodiscard]] auto client() const -> const transport::TransportClient&;

    private:

        auto init_get(const std::string& source, const std::vector<CachedArtifact>& candidates)
            -> Resource;
        auto execute_for_resource(transport::HttpVerb verb, const std::string& source) -> Resource;
        void do_put(const std::filesystem::path& source, const std::string& destination);

        std::unique_ptr<transport::TransportClient> p_client;
        const ExternalArtifactCache* p_artifact_cache;
        ChecksumMatcher m_checksum_matcher;
        DirectoryLister m_lister;
        TransferNotifier m_notifier;
        TransferProgress m_progress;
    };

    /** Raise a ``server_error`` for an unsuccessful status of @p method. */
    [[noreturn]] void throw_server_error(const transport::HttpMethod& method, int status);
}

#endif
