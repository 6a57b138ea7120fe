// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_API_CONFIGURATION_HPP
#define ARTIFETCH_API_CONFIGURATION_HPP

#include <filesystem>
#include <memory>
#include <string_view>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/logging.hpp"
#include "artifetch/resource/resource_collection.hpp"
#include "artifetch/transport/parameters.hpp"

namespace YAML
{
    class Node;
}

namespace artifetch
{
    /**
     * Settings of a resolver, read from a YAML rc file.
     *
     * Environment variables written as ``$VAR`` or ``${VAR}`` are expanded before
     * the file is parsed.
     */
    struct Configuration
    {
        transport::RemoteFetchParams remote_fetch_params = {};
        resource::ChecksumFormat checksum_format = {};
        resource::IndexFormat index_format = {};
        LoggingParams logging_params = {};

        static auto load(const std::filesystem::path& file) -> expected_t<Configuration>;
        static auto from_yaml(std::string_view content) -> expected_t<Configuration>;
        static auto from_node(const YAML::Node& node) -> expected_t<Configuration>;
    };

    /** Normalize the "ssl_verify" setting, "false" and "0" meaning no verification. */
    auto normalize_ssl_verify(std::string_view value) -> std::string;

    /** Install the spdlog log handler configured with @p params. */
    void init_logging(const LoggingParams& params);

    /**
     * Create a collection over libcurl configured from @p config.
     *
     * @param artifact_cache Optional source of cached artifacts, must outlive the collection.
     */
    auto make_resource_collection(
        const Configuration& config,
        const resource::ExternalArtifactCache* artifact_cache = nullptr
    ) -> std::unique_ptr<resource::HttpResourceCollection>;
}

#endif
