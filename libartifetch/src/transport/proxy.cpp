// Copyright (c) 2025, Artifetch Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <charconv>

#include <fmt/format.h>

#include "artifetch/core/logging.hpp"
#include "artifetch/transport/proxy.hpp"
#include "artifetch/util/string.hpp"

namespace artifetch::transport
{
    /***************
     *  HttpProxy  *
     ***************/

    auto HttpProxy::parse(std::string_view url) -> std::optional<HttpProxy>
    {
        // A bare "host:port" is an HTTP proxy.
        const auto parsed = util::URL::parse(
            util::contains(url, "://") ? std::string(url) : util::concat("http://", url)
        );
        if (!parsed || parsed->host().empty())
        {
            return std::nullopt;
        }

        auto out = HttpProxy();
        out.scheme = parsed->scheme();
        out.host = parsed->host();
        if (parsed->port().empty())
        {
            out.port = (out.scheme == "https") ? 443 : 80;
        }
        else
        {
            const auto& port = parsed->port();
            const auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), out.port);
            if (ec != std::errc() || ptr != port.data() + port.size())
            {
                return std::nullopt;
            }
        }
        if (parsed->has_user())
        {
            out.username = parsed->user();
            out.password = parsed->password();
        }
        return out;
    }

    auto HttpProxy::url() const -> std::string
    {
        return fmt::format("{}://{}:{}", scheme, host, port);
    }

    /**********************
     *  MapProxySettings  *
     **********************/

    auto proxy_match(const util::URL& url, const std::map<std::string, std::string>& proxy_servers)
        -> std::optional<std::string>
    {
        if (proxy_servers.empty())
        {
            return std::nullopt;
        }

        const auto& scheme = url.scheme();
        const auto& host = url.host();
        std::vector<std::string> options;

        if (host.empty())
        {
            options = { scheme, "all" };
        }
        else
        {
            options = {
                util::concat(scheme, "://", host),
                scheme,
                util::concat("all://", host),
                "all",
            };
        }

        for (const auto& option : options)
        {
            if (auto proxy = proxy_servers.find(option); proxy != proxy_servers.end())
            {
                return proxy->second;
            }
        }

        return std::nullopt;
    }

    MapProxySettings::MapProxySettings(
        std::map<std::string, std::string> proxy_servers,
        std::vector<std::string> no_proxy
    )
        : m_proxy_servers(std::move(proxy_servers))
        , m_no_proxy(std::move(no_proxy))
    {
    }

    auto MapProxySettings::is_excluded(std::string_view host) const -> bool
    {
        const auto lower_host = util::to_lower(host);
        for (const auto& entry : m_no_proxy)
        {
            const auto pattern = util::to_lower(util::strip(entry));
            if (pattern.empty())
            {
                continue;
            }
            if (pattern == "*" || pattern == lower_host)
            {
                return true;
            }
            if (util::starts_with(pattern, '.')
                && (util::ends_with(lower_host, pattern) || lower_host == pattern.substr(1)))
            {
                return true;
            }
        }
        return false;
    }

    auto MapProxySettings::get_proxy(const util::URL& target) const -> std::optional<HttpProxy>
    {
        if (is_excluded(target.host()))
        {
            return std::nullopt;
        }
        const auto match = proxy_match(target, m_proxy_servers);
        if (!match)
        {
            return std::nullopt;
        }
        auto proxy = HttpProxy::parse(*match);
        if (!proxy)
        {
            LOG_WARNING << "Ignoring invalid proxy URL '" << *match << "' for " << target.host();
        }
        return proxy;
    }

    /****************
     *  ProxyState  *
     ****************/

    auto ProxyState::proxy() const -> const HttpProxy*
    {
        return p_proxy.get();
    }

    auto ProxyState::has_proxy() const -> bool
    {
        return p_proxy != nullptr;
    }

    void ProxyState::set_proxy(HttpProxy proxy)
    {
        p_proxy = std::make_unique<const HttpProxy>(std::move(proxy));
        ++m_change_count;
    }

    void ProxyState::clear()
    {
        if (p_proxy)
        {
            p_proxy.reset();
            ++m_change_count;
        }
    }

    auto ProxyState::change_count() const -> std::size_t
    {
        return m_change_count;
    }

    /*******************
     *  ProxyResolver  *
     *******************/

    ProxyResolver::ProxyResolver(std::unique_ptr<ProxySettings> settings)
        : p_settings(std::move(settings))
    {
    }

    auto ProxyResolver::resolve_for(const util::URL& target, ProxyState& state) const
        -> std::optional<HttpProxy>
    {
        auto proxy = p_settings ? p_settings->get_proxy(target) : std::nullopt;
        if (proxy)
        {
            if (!state.has_proxy())
            {
                LOG_INFO << "Using proxy " << proxy->url() << " for " << target.host();
                state.set_proxy(*proxy);
            }
        }
        else
        {
            state.clear();
        }
        return proxy;
    }

    auto ProxyResolver::resolve_for(std::string_view target, ProxyState& state) const
        -> std::optional<HttpProxy>
    {
        const auto url = util::URL::parse(target);
        if (!url)
        {
            LOG_DEBUG << url.error().what;
            state.clear();
            return std::nullopt;
        }
        return resolve_for(*url, state);
    }

    auto ProxyResolver::settings() const -> const ProxySettings*
    {
        return p_settings.get();
    }
}
