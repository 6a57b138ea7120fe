// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_RESOURCE_RESOURCE_HPP
#define ARTIFETCH_RESOURCE_RESOURCE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "artifetch/resource/cached_artifact.hpp"
#include "artifetch/resource/transfer.hpp"
#include "artifetch/transport/http_method.hpp"

namespace artifetch::resource
{
    /** A resource the server reported as not found. */
    class MissingResource
    {
    public:

        explicit MissingResource(std::string url);

        [[nodiscard]] auto url() const -> const std::string&;

    private:

        std::string m_url;
    };

    /** A remote resource whose content is available from a local file. */
    class CachedResource
    {
    public:

        CachedResource(std::string url, CachedArtifact artifact);

        [[nodiscard]] auto url() const -> const std::string&;
        [[nodiscard]] auto artifact() const -> const CachedArtifact&;
        [[nodiscard]] auto content_length() const -> std::int64_t;

        void write_to(const std::filesystem::path& destination, TransferProgress& progress) const;

    private:

        std::string m_url;
        CachedArtifact m_artifact;
    };

    /** A remote resource held by an executed request whose body is not yet read. */
    class RemoteResource
    {
    public:

        RemoteResource(std::string url, std::unique_ptr<transport::HttpMethod> method);

        [[nodiscard]] auto url() const -> const std::string&;
        [[nodiscard]] auto content_length() const -> std::optional<std::int64_t>;
        [[nodiscard]] auto method() const -> const transport::HttpMethod&;

        /** Stream the body to @p destination, the connection is released afterwards. */
        void write_to(const std::filesystem::path& destination, TransferProgress& progress);

        void release();

    private:

        std::string m_url;
        std::unique_ptr<transport::HttpMethod> p_method;
    };

    /**
     * The outcome of a resource request, exactly one of missing, cached or remote.
     */
    class Resource
    {
    public:

        using value_type = std::variant<MissingResource, CachedResource, RemoteResource>;

        Resource(MissingResource resource);
        Resource(CachedResource resource);
        Resource(RemoteResource resource);

        ~Resource();

        Resource(const Resource&) = delete;
        Resource& operator=(const Resource&) = delete;
        Resource(Resource&&) = default;
        Resource& operator=(Resource&&) = default;

        [[nodiscard]] auto url() const -> const std::string&;
        [[nodiscard]] auto exists() const -> bool;
        [[nodiscard]] auto is_cached() const -> bool;
        [[nodiscard]] auto is_remote() const -> bool;
        [[nodiscard]] auto content_length() const -> std::optional<std::int64_t>;

        /**
         * Write the content of the resource to @p destination, creating its parent
         * directories.
         *
         * @throws artifetch_error with ``precondition_violation`` for a missing resource.
         */
        void write_to(const std::filesystem::path& destination, TransferProgress& progress);

        /** Release the connection held by a remote resource, only the first call has an effect. */
        void release();

        [[nodiscard]] auto value() const -> const value_type&;

        template <typename T>
        [[nodiscard]] auto get_if() const -> const T*
        {
            return std::get_if<T>(&m_value);
        }

    private:

        value_type m_value;
    };

    /** Create the parent directories of @p destination. */
    void create_parent_directories(const std::filesystem::path& destination);
}

#endif
