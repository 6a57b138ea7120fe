// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fmt/format.h>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/logging.hpp"
#include "artifetch/core/util_scope.hpp"
#include "artifetch/resource/resource_collection.hpp"
#include "artifetch/util/url.hpp"

namespace artifetch::resource
{
    void throw_server_error(const transport::HttpMethod& method, int status)
    {
        const auto text = method.status_text();
        throw artifetch_error(
            fmt::format(
                "Could not {} '{}'. Received status code {} from server: {}",
                transport::name_of(method.verb()),
                util::hide_secrets(method.url()),
                status,
                text
            ),
            artifetch_error_code::server_error,
            http_status{ status, text }
        );
    }

    HttpResourceCollection::HttpResourceCollection(
        std::unique_ptr<transport::TransportClient> client,
        const ExternalArtifactCache* artifact_cache,
        ResourceCollectionParams params
    )
        : p_client(std::move(client))
        , p_artifact_cache(artifact_cache)
        , m_checksum_matcher(*p_client, std::move(params.checksum_format))
        , m_lister(*p_client, std::make_unique<ApacheIndexParser>(std::move(params.index_format)))
        , m_progress(m_notifier)
    {
    }

    auto HttpResourceCollection::get_resource(
        const std::string& source,
        const std::optional<ArtifactIdentity>& artifact_id
    ) -> Resource
    {
        LOG_DEBUG << "Constructing GET resource: " << source;

        std::vector<CachedArtifact> candidates;
        if (artifact_id && p_artifact_cache)
        {
            p_artifact_cache->add_matching_cached_artifacts(*artifact_id, candidates);
        }
        return init_get(source, candidates);
    }

    auto HttpResourceCollection::get_resource(
        const std::string& source,
        const std::optional<ArtifactIdentity>& artifact_id,
        bool for_download
    ) -> Resource
    {
        if (for_download)
        {
            return get_resource(source, artifact_id);
        }
        return head_resource(source);
    }

    auto HttpResourceCollection::get_resource(
        const std::string& source,
        const std::vector<CachedArtifact>& candidates
    ) -> Resource
    {
        LOG_DEBUG << "Constructing GET resource: " << source;
        return init_get(source, candidates);
    }

    auto HttpResourceCollection::head_resource(const std::string& source) -> Resource
    {
        LOG_DEBUG << "Constructing HEAD resource: " << source;
        return execute_for_resource(transport::HttpVerb::head, source);
    }

    auto HttpResourceCollection::init_get(
        const std::string& source,
        const std::vector<CachedArtifact>& candidates
    ) -> Resource
    {
        if (!candidates.empty())
        {
            if (auto cached = m_checksum_matcher.try_match(source, candidates))
            {
                return Resource(std::move(*cached));
            }
        }
        return execute_for_resource(transport::HttpVerb::get, source);
    }

    auto HttpResourceCollection::execute_for_resource(transport::HttpVerb verb, const std::string& source)
        -> Resource
    {
        const char* verb_name = transport::name_of(verb);
        auto method = std::make_unique<transport::HttpMethod>(verb, source);
        const int status = p_client->execute(*method);

        if (status == 404)
        {
            LOG_INFO << "Resource missing. [HTTP " << verb_name << ": " << source << "]";
            return Resource(MissingResource(source));
        }
        if (!transport::was_successful(status))
        {
            LOG_INFO << fmt::format(
                "Failed to get resource: {} ({}). [HTTP {}: {}]",
                status,
                method->status_text(),
                verb_name,
                source
            );
            throw_server_error(*method, status);
        }
        LOG_INFO << "Resource found. [HTTP " << verb_name << ": " << source << "]";
        return Resource(RemoteResource(source, std::move(method)));
    }

    void HttpResourceCollection::download_resource(Resource& resource, const std::filesystem::path& destination)
    {
        const auto descriptor = ResourceDescriptor{
            resource.url(),
            resource.exists(),
            resource.content_length(),
        };
        m_notifier.fire_transfer_initiated(descriptor, RequestType::get);
        on_scope_exit reset_total{ [this] { m_progress.end(); } };
        try
        {
            m_progress.begin(RequestType::get, descriptor.content_length);
            resource.write_to(destination, m_progress);
        }
        catch (const std::exception& ex)
        {
            m_notifier.fire_transfer_failed(descriptor, RequestType::get, ex);
            throw;
        }
        m_notifier.fire_transfer_completed(descriptor, RequestType::get, m_progress.transferred());
    }

    void HttpResourceCollection::get(const std::string& source, const std::filesystem::path& destination)
    {
        auto resource = get_resource(source, std::nullopt);
        download_resource(resource, destination);
    }

    void HttpResourceCollection::put(const std::filesystem::path& source, const std::string& destination)
    {
        LOG_DEBUG << "Attempting to put resource " << destination;
        if (!std::filesystem::is_regular_file(source))
        {
            throw artifetch_error(
                fmt::format("Cannot put '{}': not a regular file", source.string()),
                artifetch_error_code::precondition_violation
            );
        }

        const auto length = static_cast<std::int64_t>(std::filesystem::file_size(source));
        const auto descriptor = ResourceDescriptor{ destination, true, length };
        m_notifier.fire_transfer_initiated(descriptor, RequestType::put);
        on_scope_exit reset_total{ [this] { m_progress.end(); } };
        try
        {
            m_progress.begin(RequestType::put, length);
            do_put(source, destination);
        }
        catch (const std::exception& ex)
        {
            m_notifier.fire_transfer_failed(descriptor, RequestType::put, ex);
            throw;
        }
        m_notifier.fire_transfer_completed(descriptor, RequestType::put, m_progress.transferred());
    }

    void HttpResourceCollection::do_put(const std::filesystem::path& source, const std::string& destination)
    {
        transport::HttpMethod method(transport::HttpVerb::put, destination);
        on_scope_exit release{ [&method] { method.release_connection(); } };

        method.set_request_body(std::make_unique<transport::FileRequestBody>(
            source,
            [this](std::size_t chunk_size) { m_progress.add(chunk_size); }
        ));
        const int status = p_client->execute(method);
        if (!transport::was_successful(status))
        {
            throw_server_error(method, status);
        }
        LOG_INFO << "Resource uploaded. [HTTP PUT: " << destination << "]";
    }

    auto HttpResourceCollection::list(const std::string& parent) -> std::optional<std::vector<std::string>>
    {
        return m_lister.list(parent);
    }

    void HttpResourceCollection::add_transfer_listener(TransferListener& listener)
    {
        m_notifier.add_listener(listener);
    }

    void HttpResourceCollection::remove_transfer_listener(const TransferListener& listener)
    {
        m_notifier.remove_listener(listener);
    }

    bool HttpResourceCollection::has_transfer_listener(const TransferListener& listener) const
    {
        return m_notifier.has_listener(listener);
    }

    auto HttpResourceCollection::progress() const -> const TransferProgress&
    {
        return m_progress;
    }

    auto HttpResourceCollection::client() const -> const transport::TransportClient&
    {
        return *p_client;
    }
}
