// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <fstream>
#include <system_error>

#include <fmt/format.h>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/logging.hpp"
#include "artifetch/core/util_scope.hpp"
#include "artifetch/resource/resource.hpp"
#include "artifetch/util/url.hpp"

namespace artifetch::resource
{
    namespace
    {
        constexpr std::size_t copy_buffer_size = 64 * 1024;

        template <class... Ts>
        struct overloaded : Ts...
        {
            using Ts::operator()...;
        };

        auto open_destination(const std::filesystem::path& destination) -> std::ofstream
        {
            create_parent_directories(destination);
            std::ofstream out(destination, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw artifetch_error(
                    fmt::format("Could not open '{}' for writing", destination.string()),
                    artifetch_error_code::io_error
                );
            }
            return out;
        }

        void write_chunk(
            std::ofstream& out,
            const std::filesystem::path& destination,
            const char* data,
            std::size_t size
        )
        {
            out.write(data, static_cast<std::streamsize>(size));
            if (!out)
            {
                throw artifetch_error(
                    fmt::format("Could not write to '{}'", destination.string()),
                    artifetch_error_code::io_error
                );
            }
        }

        void close_destination(std::ofstream& out, const std::filesystem::path& destination)
        {
            out.close();
            if (out.fail())
            {
                throw artifetch_error(
                    fmt::format("Could not close '{}'", destination.string()),
                    artifetch_error_code::io_error
                );
            }
        }
    }

    void create_parent_directories(const std::filesystem::path& destination)
    {
        const auto parent = destination.parent_path();
        if (parent.empty())
        {
            return;
        }
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw artifetch_error(
                fmt::format("Could not create directory '{}': {}", parent.string(), ec.message()),
                artifetch_error_code::io_error
            );
        }
    }

    /*********************
     *  MissingResource  *
     *********************/

    MissingResource::MissingResource(std::string url)
        : m_url(std::move(url))
    {
    }

    auto MissingResource::url() const -> const std::string&
    {
        return m_url;
    }

    /********************
     *  CachedResource  *
     ********************/

    CachedResource::CachedResource(std::string url, CachedArtifact artifact)
        : m_url(std::move(url))
        , m_artifact(std::move(artifact))
    {
    }

    auto CachedResource::url() const -> const std::string&
    {
        return m_url;
    }

    auto CachedResource::artifact() const -> const CachedArtifact&
    {
        return m_artifact;
    }

    auto CachedResource::content_length() const -> std::int64_t
    {
        return m_artifact.size;
    }

    void CachedResource::write_to(const std::filesystem::path& destination, TransferProgress& progress) const
    {
        std::ifstream in(m_artifact.path, std::ios::in | std::ios::binary);
        if (!in.is_open())
        {
            throw artifetch_error(
                fmt::format("Could not open cached artifact '{}'", m_artifact.path.string()),
                artifetch_error_code::io_error
            );
        }

        auto out = open_destination(destination);
        std::array<char, copy_buffer_size> buffer;
        while (in)
        {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto count = static_cast<std::size_t>(in.gcount());
            if (count == 0)
            {
                break;
            }
            write_chunk(out, destination, buffer.data(), count);
            progress.add(count);
        }
        if (in.bad())
        {
            throw artifetch_error(
                fmt::format("Could not read cached artifact '{}'", m_artifact.path.string()),
                artifetch_error_code::io_error
            );
        }
        close_destination(out, destination);
        LOG_DEBUG << "Copied cached artifact " << m_artifact.path.string() << " for " << m_url;
    }

    /********************
     *  RemoteResource  *
     ********************/

    RemoteResource::RemoteResource(std::string url, std::unique_ptr<transport::HttpMethod> method)
        : m_url(std::move(url))
        , p_method(std::move(method))
    {
    }

    auto RemoteResource::url() const -> const std::string&
    {
        return m_url;
    }

    auto RemoteResource::content_length() const -> std::optional<std::int64_t>
    {
        return p_method->response_content_length();
    }

    auto RemoteResource::method() const -> const transport::HttpMethod&
    {
        return *p_method;
    }

    void RemoteResource::write_to(const std::filesystem::path& destination, TransferProgress& progress)
    {
        on_scope_exit release_connection{ [this] { release(); } };

        auto out = open_destination(destination);
        p_method->write_response_body(
            [&](const char* data, std::size_t size)
            {
                write_chunk(out, destination, data, size);
                progress.add(size);
            }
        );
        close_destination(out, destination);
    }

    void RemoteResource::release()
    {
        if (p_method)
        {
            p_method->release_connection();
        }
    }

    /**************
     *  Resource  *
     **************/

    Resource::Resource(MissingResource resource)
        : m_value(std::move(resource))
    {
    }

    Resource::Resource(CachedResource resource)
        : m_value(std::move(resource))
    {
    }

    Resource::Resource(RemoteResource resource)
        : m_value(std::move(resource))
    {
    }

    Resource::~Resource()
    {
        release();
    }

    auto Resource::url() const -> const std::string&
    {
        return std::visit([](const auto& res) -> const std::string& { return res.url(); }, m_value);
    }

    auto Resource::exists() const -> bool
    {
        return !std::holds_alternative<MissingResource>(m_value);
    }

    auto Resource::is_cached() const -> bool
    {
        return std::holds_alternative<CachedResource>(m_value);
    }

    auto Resource::is_remote() const -> bool
    {
        return std::holds_alternative<RemoteResource>(m_value);
    }

    auto Resource::content_length() const -> std::optional<std::int64_t>
    {
        return std::visit(
            overloaded{
                [](const MissingResource&) -> std::optional<std::int64_t> { return std::nullopt; },
                [](const CachedResource& res) -> std::optional<std::int64_t>
                { return res.content_length(); },
                [](const RemoteResource& res) { return res.content_length(); },
            },
            m_value
        );
    }

    void Resource::write_to(const std::filesystem::path& destination, TransferProgress& progress)
    {
        std::visit(
            overloaded{
                [](const MissingResource& res)
                {
                    throw artifetch_error(
                        fmt::format(
                            "Cannot write missing resource '{}' to a destination",
                            util::hide_secrets(res.url())
                        ),
                        artifetch_error_code::precondition_violation
                    );
                },
                [&](const CachedResource& res) { res.write_to(destination, progress); },
                [&](RemoteResource& res) { res.write_to(destination, progress); },
            },
            m_value
        );
    }

    void Resource::release()
    {
        if (auto* remote = std::get_if<RemoteResource>(&m_value))
        {
            remote->release();
        }
    }

    auto Resource::value() const -> const value_type&
    {
        return m_value;
    }
}
