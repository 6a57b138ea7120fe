// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <fstream>
#include <sstream>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "artifetch/api/configuration.hpp"
#include "artifetch/core/logging_spdlog.hpp"
#include "artifetch/transport/proxy.hpp"
#include "artifetch/transport/transport.hpp"
#include "artifetch/transport/transport_client.hpp"
#include "artifetch/util/environment.hpp"

namespace artifetch
{
    namespace
    {
        template <class T>
        void read_scalar(const YAML::Node& node, const char* key, T& value)
        {
            if (const auto child = node[key])
            {
                value = child.as<T>();
            }
        }

        template <class T>
        void read_sequence(const YAML::Node& node, const char* key, std::vector<T>& value)
        {
            if (const auto child = node[key])
            {
                if (child.IsScalar())
                {
                    value = { child.as<T>() };
                }
                else
                {
                    value = child.as<std::vector<T>>();
                }
            }
        }

        void read_remote_fetch_params(const YAML::Node& node, transport::RemoteFetchParams& params)
        {
            read_scalar(node, "user_agent", params.user_agent);
            read_scalar(node, "username", params.credentials.username);
            read_scalar(node, "password", params.credentials.password);
            read_scalar(node, "ssl_verify", params.ssl_verify);
            params.ssl_verify = normalize_ssl_verify(params.ssl_verify);
            read_scalar(node, "ssl_no_revoke", params.ssl_no_revoke);
            read_scalar(node, "remote_connect_timeout_secs", params.connect_timeout_secs);
            read_scalar(node, "remote_low_speed_limit", params.set_low_speed_opt);
            read_scalar(node, "verbose", params.verbose);
            if (const auto proxies = node["proxy_servers"])
            {
                params.proxy_servers = proxies.as<std::map<std::string, std::string>>();
            }
            read_sequence(node, "no_proxy", params.no_proxy);
        }

        void read_logging_params(const YAML::Node& node, LoggingParams& params)
        {
            if (const auto level = node["level"])
            {
                const auto name = level.as<std::string>();
                const auto parsed = log_level_from_name(name);
                if (!parsed)
                {
                    throw artifetch_error(
                        fmt::format("Invalid logging level '{}'", name),
                        artifetch_error_code::configuration_error
                    );
                }
                params.logging_level = *parsed;
            }
            read_scalar(node, "pattern", params.log_pattern);
        }
    }

    auto normalize_ssl_verify(std::string_view value) -> std::string
    {
        if ((value == "false") || (value == "0") || (value == "<false>"))
        {
            return "<false>";
        }
        if ((value == "true") || (value == "1"))
        {
            return "";
        }
        return std::string(value);
    }

    auto Configuration::from_node(const YAML::Node& node) -> expected_t<Configuration>
    {
        auto config = Configuration();
        if (!node || node.IsNull())
        {
            return config;
        }
        if (!node.IsMap())
        {
            return make_unexpected(
                "The configuration is misformatted, a mapping is expected",
                artifetch_error_code::configuration_error
            );
        }

        try
        {
            read_remote_fetch_params(node, config.remote_fetch_params);
            if (const auto checksum = node["checksum"])
            {
                read_scalar(checksum, "extension", config.checksum_format.extension);
                read_scalar(checksum, "strip_trailing_content", config.checksum_format.strip_trailing_content);
                read_scalar(checksum, "accept_colon_prefixed", config.checksum_format.accept_colon_prefixed);
            }
            if (const auto listing = node["listing"])
            {
                read_sequence(listing, "index_markers", config.index_format.index_markers);
            }
            if (const auto logging = node["logging"])
            {
                read_logging_params(logging, config.logging_params);
            }
        }
        catch (const artifetch_error& ex)
        {
            return tl::make_unexpected(ex);
        }
        catch (const YAML::Exception& ex)
        {
            return make_unexpected(
                fmt::format("Invalid configuration value: {}", ex.what()),
                artifetch_error_code::configuration_error
            );
        }
        return config;
    }

    auto Configuration::from_yaml(std::string_view content) -> expected_t<Configuration>
    {
        YAML::Node node;
        try
        {
            node = YAML::Load(util::expandvars(std::string(content)));
        }
        catch (const YAML::Exception& ex)
        {
            return make_unexpected(
                fmt::format("Could not parse configuration: {}", ex.what()),
                artifetch_error_code::configuration_error
            );
        }
        return from_node(node);
    }

    auto Configuration::load(const std::filesystem::path& file) -> expected_t<Configuration>
    {
        std::ifstream in_file(file);
        if (!in_file.is_open())
        {
            return make_unexpected(
                fmt::format("Could not open configuration file '{}'", file.string()),
                artifetch_error_code::configuration_error
            );
        }
        std::stringstream str_stream;
        str_stream << in_file.rdbuf();

        auto config = from_yaml(str_stream.str());
        if (!config)
        {
            return make_unexpected(
                fmt::format("Error in file {}: {}", file.string(), config.error().what()),
                artifetch_error_code::configuration_error
            );
        }
        LOG_DEBUG << "Loaded configuration file " << file.string();
        return config;
    }

    void init_logging(const LoggingParams& params)
    {
        logging::set_log_handler(std::make_unique<logging::spdlogimpl::LogHandler_spdlog>(), params);
    }

    auto make_resource_collection(
        const Configuration& config,
        const resource::ExternalArtifactCache* artifact_cache
    ) -> std::unique_ptr<resource::HttpResourceCollection>
    {
        const auto& params = config.remote_fetch_params;
        auto client = std::make_unique<transport::TransportClient>(
            transport::make_curl_transport(params),
            params.credentials,
            std::make_unique<transport::MapProxySettings>(params.proxy_servers, params.no_proxy),
            params.user_agent
        );
        return std::make_unique<resource::HttpResourceCollection>(
            std::move(client),
            artifact_cache,
            resource::ResourceCollectionParams{ config.checksum_format, config.index_format }
        );
    }
}
