#pragma once

#include <string>
#include <string_view>

#include "result.hpp"

namespace httpool {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // Path plus optional query; "/" when the URL has none.
        std::string target;
    };

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL into its components.
    /// @param url The URL string to parse.
    /// @return The components, or an InvalidUrl error.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [](std::string msg) {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s = url;

        bool https = false;
        if (s.rfind("https://", 0) == 0) {
            https = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // The authority ends at the first '/', '?' or '#'
        std::string_view hostport = s;
        std::string_view rest;
        if (auto end = s.find_first_of("/?#"); end != std::string_view::npos) {
            hostport = s.substr(0, end);
            rest = s.substr(end);
        }

        // Drop userinfo, it never takes part in the authority we connect to
        if (auto at = hostport.rfind('@'); at != std::string_view::npos) {
            hostport.remove_prefix(at + 1);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        // IPv6 literals keep their brackets out of the host
        if (hostport.front() == '[') {
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = std::string(hostport.substr(1, close - 1));
            std::string_view after = hostport.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':' || after.size() == 1) {
                    return make_err("URL has empty port");
                }
                port = std::string(after.substr(1));
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
        } else {
            host = std::string(hostport);
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }
        for (char c : port) {
            if (c < '0' || c > '9') {
                return make_err("URL port is not numeric");
            }
        }
        if (port.empty()) port = https ? "443" : "80";

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        if (rest.empty() || rest.front() != '/') {
            out.target = "/";
            if (!rest.empty() && rest.front() == '?') out.target.append(rest);
        } else {
            out.target = std::string(rest);
        }
        if (auto hash = out.target.find('#'); hash != std::string::npos) {
            out.target.erase(hash);
        }
        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace httpool
