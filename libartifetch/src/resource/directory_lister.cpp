// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <array>
#include <regex>

#include <fmt/format.h>

#include "artifetch/core/error_handling.hpp"
#include "artifetch/core/logging.hpp"
#include "artifetch/core/util_scope.hpp"
#include "artifetch/resource/directory_lister.hpp"
#include "artifetch/transport/transport_client.hpp"
#include "artifetch/util/string.hpp"

namespace artifetch::resource
{
    namespace
    {
        const std::regex& anchor_regex()
        {
            static const std::regex anchor{
                R"re(<a\s[^>]*?href\s*=\s*(?:"([^"]*)"|'([^']*)'|([^\s>]+))[^>]*>)re",
                std::regex::icase | std::regex::ECMAScript,
            };
            return anchor;
        }

        auto decode_html_entities(std::string_view href) -> std::string
        {
            std::string out(href);
            constexpr std::array<std::pair<std::string_view, std::string_view>, 5> entities = { {
                { "&lt;", "<" },
                { "&gt;", ">" },
                { "&quot;", "\"" },
                { "&#39;", "'" },
                { "&amp;", "&" },
            } };
            for (const auto& [entity, text] : entities)
            {
                for (auto pos = out.find(entity); pos != std::string::npos;
                     pos = out.find(entity, pos + text.size()))
                {
                    out.replace(pos, entity.size(), text);
                }
            }
            return out;
        }

        /** Whether the path of a listed URL is a directory missing its trailing slash. */
        auto needs_trailing_slash(std::string_view path) -> bool
        {
            const auto lower_path = util::to_lower(path);
            return !util::ends_with(lower_path, '/') && !util::ends_with(lower_path, ".html")
                   && !util::ends_with(lower_path, ".htm");
        }

        auto as_directory(const util::URL& url) -> tl::expected<util::URL, util::URL::ParseError>
        {
            if (!needs_trailing_slash(url.path()))
            {
                return url;
            }
            const auto& path = url.path();
            const auto last_segment = path.substr(path.rfind('/') + 1);
            auto reference = util::concat("./", last_segment, "/");
            if (!url.query().empty())
            {
                reference = util::concat(reference, "?", url.query());
            }
            return url.resolve(reference);
        }

        auto is_skipped_href(std::string_view href) -> bool
        {
            return href.empty() || util::starts_with(href, '?') || util::starts_with(href, '#')
                   || href == ".." || href == "../" || href == "." || href == "./"
                   || util::starts_with(util::to_lower(href), "mailto:")
                   || util::starts_with(util::to_lower(href), "javascript:");
        }
    }

    /***********************
     *  ApacheIndexParser  *
     ***********************/

    ApacheIndexParser::ApacheIndexParser(IndexFormat format)
        : m_format(std::move(format))
    {
    }

    auto ApacheIndexParser::is_index(std::string_view content) const -> bool
    {
        const auto lower_content = util::to_lower(content);
        return std::any_of(
            m_format.index_markers.cbegin(),
            m_format.index_markers.cend(),
            [&](const std::string& marker)
            { return !marker.empty() && util::contains(lower_content, util::to_lower(marker)); }
        );
    }

    auto ApacheIndexParser::parse(const util::URL& base, std::string_view content) const
        -> std::optional<std::vector<std::string>>
    {
        if (!is_index(content))
        {
            return std::nullopt;
        }

        // Entries are the children of the directory holding the page.
        const auto directory = base.resolve("./");
        const auto base_str = directory ? directory->str() : base.str();
        std::vector<std::string> entries;
        const std::string text(content);
        auto it = std::sregex_iterator(text.cbegin(), text.cend(), anchor_regex());
        for (; it != std::sregex_iterator(); ++it)
        {
            const auto& match = *it;
            std::string href;
            for (std::size_t group = 1; group <= 3; ++group)
            {
                if (match[group].matched)
                {
                    href = match[group].str();
                    break;
                }
            }
            href = decode_html_entities(util::strip(href));
            if (is_skipped_href(href))
            {
                continue;
            }

            const auto resolved = base.resolve(href);
            if (!resolved)
            {
                LOG_DEBUG << "Skipping index entry '" << href << "': " << resolved.error().what;
                continue;
            }
            auto entry = resolved->str();
            // Only children of the listed directory, which also rules out parent and
            // foreign links.
            if (entry == base_str || !util::starts_with(entry, base_str))
            {
                continue;
            }
            if (std::find(entries.cbegin(), entries.cend(), entry) == entries.cend())
            {
                entries.push_back(std::move(entry));
            }
        }
        return entries;
    }

    /*********************
     *  DirectoryLister  *
     *********************/

    DirectoryLister::DirectoryLister(transport::TransportClient& client, std::unique_ptr<IndexParser> parser)
        : p_client(&client)
        , p_parser(std::move(parser))
    {
    }

    auto DirectoryLister::list(const std::string& parent) -> std::optional<std::vector<std::string>>
    {
        auto base = util::URL::parse(parent).and_then(as_directory);
        if (!base)
        {
            throw artifetch_error(base.error().what, artifetch_error_code::precondition_violation);
        }

        transport::HttpMethod method(transport::HttpVerb::get, base->str());
        on_scope_exit release{ [&method] { method.release_connection(); } };

        const int status = p_client->execute(method);
        if (status == 404)
        {
            LOG_INFO << "Directory missing. [HTTP GET: " << base->str() << "]";
            return std::nullopt;
        }
        if (!transport::was_successful(status))
        {
            const auto text = method.status_text();
            throw artifetch_error(
                fmt::format(
                    "Could not list '{}'. Received status code {} from server: {}",
                    util::hide_secrets(base->str()),
                    status,
                    text
                ),
                artifetch_error_code::server_error,
                http_status{ status, text }
            );
        }

        auto entries = p_parser->parse(*base, method.response_body_as_string());
        if (!entries)
        {
            LOG_DEBUG << "Not a directory index. [HTTP GET: " << base->str() << "]";
        }
        return entries;
    }
}
