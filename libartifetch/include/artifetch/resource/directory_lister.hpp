// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ARTIFETCH_RESOURCE_DIRECTORY_LISTER_HPP
#define ARTIFETCH_RESOURCE_DIRECTORY_LISTER_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "artifetch/util/url.hpp"

namespace artifetch::transport
{
    class TransportClient;
}

namespace artifetch::resource
{
    struct IndexFormat
    {
        /// Text identifying a page as a directory index, any of them is enough.
        std::vector<std::string> index_markers = { "Index of" };
    };

    /** Extract the entries of a directory index page. */
    class IndexParser
    {
    public:

        virtual ~IndexParser() = default;

        /**
         * Parse the page @p content served at @p base.
         *
         * @returns The absolute URLs of the entries, or nothing if the page is not an index.
         */
        virtual auto parse(const util::URL& base, std::string_view content) const
            -> std::optional<std::vector<std::string>> = 0;
    };

    /** Parser of the index pages generated by Apache httpd and look-alike servers. */
    class ApacheIndexParser final : public IndexParser
    {
    public:

        explicit ApacheIndexParser(IndexFormat format = {});

        auto parse(const util::URL& base, std::string_view content) const
            -> std::optional<std::vector<std::string>> override;

        [[nodiscard]] auto is_index(std::string_view content) const -> bool;

    private:

        IndexFormat m_format;
    };

    class DirectoryLister
    {
    public:

        DirectoryLister(transport::TransportClient& client, std::unique_ptr<IndexParser> parser);

        /**
         * List the entries of the directory index at @p parent.
         *
         * @returns Nothing when @p parent is not found or is not an index page.
         */
        auto list(const std::string& parent) -> std::optional<std::vector<std::string>>;

    private:

        transport::TransportClient* p_client;
        std::unique_ptr<IndexParser> p_parser;
    };
}

#endif
