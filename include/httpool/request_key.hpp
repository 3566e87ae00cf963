#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include "result.hpp"
#include "url.hpp"

namespace httpool {

    /** @brief Transport scheme of a request key. */
    enum class Scheme {
        Http,  /**< Plain TCP. */
        Https  /**< TLS over TCP. */
    };

    inline const char* to_string(Scheme s) {
        return s == Scheme::Https ? "https" : "http";
    }

    /**
     * @brief Identifies a class of interchangeable connections.
     *
     * Two requests may share a pooled connection only when their keys compare
     * equal. Keys handed to the pool are normalized first.
     */
    struct RequestKey {
        Scheme scheme{Scheme::Http};
        std::string host;
        std::string port;

        bool https() const noexcept { return scheme == Scheme::Https; }

        inline void normalize_default_port() {
            if (port.empty()) port = https() ? "443" : "80";
        }

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        void normalize() {
            normalize_default_port();
            normalize_host();
        }

        friend bool operator==(RequestKey const& a,
                               RequestKey const& b) noexcept {
            return a.scheme == b.scheme && a.host == b.host &&
                   a.port == b.port;
        }

        friend bool operator!=(RequestKey const& a,
                               RequestKey const& b) noexcept {
            return !(a == b);
        }
    };

    /// @brief Build a normalized key.
    inline RequestKey make_request_key(Scheme scheme, std::string host,
                                       std::string port = {}) {
        RequestKey key{scheme, std::move(host), std::move(port)};
        key.normalize();
        return key;
    }

    /// @brief Derive the key of an absolute http(s) URL (scheme + authority).
    inline Result<RequestKey> request_key_from_url(std::string_view url) {
        auto parsed = parse_url(url);
        if (parsed.has_error()) return Result<RequestKey>::err(parsed.error());

        UrlComponents const& u = parsed.value();
        return Result<RequestKey>::ok(make_request_key(
            u.https ? Scheme::Https : Scheme::Http, u.host, u.port));
    }

    /// @brief "scheme://host:port", for logs.
    inline std::string to_string(RequestKey const& key) {
        std::string out = to_string(key.scheme);
        out += "://";
        if (key.host.find(':') != std::string::npos) {
            out += '[';
            out += key.host;
            out += ']';
        } else {
            out += key.host;
        }
        out += ':';
        out += key.port;
        return out;
    }

    inline std::ostream& operator<<(std::ostream& os, RequestKey const& key) {
        return os << to_string(key);
    }

}  // namespace httpool

namespace std {
    template <>
    struct hash<httpool::RequestKey> {
        size_t operator()(httpool::RequestKey const& k) const noexcept {
            // FNV-1a over scheme, host and port
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
                h ^= 0xff;
                h *= 1099511628211ull;
            };
            h ^= static_cast<size_t>(k.scheme);
            h *= 1099511628211ull;
            mix(k.host);
            mix(k.port);
            return h;
        }
    };
}  // namespace std
