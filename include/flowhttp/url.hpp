#pragma once

#include <cctype>
#include <string>
#include <string_view>
#include <vector>

#include "endpoint.hpp"
#include "result.hpp"

namespace flowhttp {

    struct UrlComponents {
        bool secure{false};
        std::string host;
        std::string port;
        // For a parsed absolute URL: full target (path + optional query).
        // For a parsed base URL (via parse_base_url): normalized prefix path
        // ("" or "/api"). For a resolved URL: full request target.
        std::string target{"/"};

        /// @brief Pool partition key for this URL.
        Endpoint endpoint() const { return Endpoint(host, port, secure); }

        /// @brief Path part of the target (without query).
        std::string_view path() const noexcept {
            std::string_view t(target);
            return t.substr(0, t.find('?'));
        }

        /// @brief Absolute form, e.g. "https://host:8443/p?q".
        std::string to_string() const {
            return std::string(secure ? "https://" : "http://") + host + ":" +
                   port + target;
        }
    };

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            return (s.rfind("https://", 0) == 0) ||
                   (s.rfind("http://", 0) == 0);
        }

        inline std::string trim_trailing_slashes(std::string s) {
            while (!s.empty() && s.back() == '/') s.pop_back();
            return s;
        }

        /// @brief True when `s` starts with an RFC 3986 scheme followed by
        /// ':' (e.g. "ftp:", "mailto:").
        inline bool has_scheme(std::string_view s) {
            if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
                return false;
            for (std::size_t i = 1; i < s.size(); ++i) {
                const auto c = static_cast<unsigned char>(s[i]);
                if (c == ':') return true;
                if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
                    return false;
            }
            return false;
        }

        /// @brief Remove "." and ".." segments from an absolute path
        /// (RFC 3986 section 5.2.4).
        inline std::string remove_dot_segments(std::string_view path) {
            if (path.empty() || path.front() != '/') return std::string(path);

            std::vector<std::string_view> segments;
            std::string_view rest = path.substr(1);
            for (;;) {
                const auto slash = rest.find('/');
                const bool last = slash == std::string_view::npos;
                std::string_view seg = last ? rest : rest.substr(0, slash);

                if (seg == ".") {
                    if (last) segments.emplace_back();
                } else if (seg == "..") {
                    if (!segments.empty()) segments.pop_back();
                    if (last) segments.emplace_back();
                } else {
                    segments.push_back(seg);
                }

                if (last) break;
                rest.remove_prefix(slash + 1);
            }

            std::string out;
            out.reserve(path.size());
            for (auto seg : segments) {
                out.push_back('/');
                out.append(seg);
            }
            if (out.empty()) out = "/";
            return out;
        }

        /// @brief Parse a base_url into components suitable for resolving
        /// relative targets. The returned UrlComponents.target is a
        /// normalized prefix ("/" becomes "", no trailing '/', no query).
        inline Result<UrlComponents> parse_base_url(std::string_view base_url);

        /// @brief Resolve a request URL (absolute or relative to base).
        inline Result<UrlComponents> resolve_url(
            std::string_view uri_or_url,
            const UrlComponents* base /*nullable*/);

        /// @brief Resolve a reference (e.g. a Location header) against the
        /// URI of the request it answered (RFC 3986 section 5.2).
        inline Result<UrlComponents> resolve_reference(
            const UrlComponents& base, std::string_view reference);

        /// @brief Percent-encode everything except RFC 3986 unreserved
        /// characters.
        inline std::string url_encode(std::string_view s) {
            static constexpr char kHex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size());
            for (char ch : s) {
                const auto c = static_cast<unsigned char>(ch);
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
                    c == '~') {
                    out.push_back(ch);
                } else {
                    out.push_back('%');
                    out.push_back(kHex[c >> 4]);
                    out.push_back(kHex[c & 0x0F]);
                }
            }
            return out;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL into its components.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg));
        };

        std::string_view s(url);

        bool secure = false;
        if (s.rfind("https://", 0) == 0) {
            secure = true;
            s.remove_prefix(std::string_view("https://").size());
        } else if (s.rfind("http://", 0) == 0) {
            s.remove_prefix(std::string_view("http://").size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Fragments never go on the wire.
        if (auto hash = s.find('#'); hash != std::string_view::npos) {
            s = s.substr(0, hash);
        }

        // Split host[:port] from path; a query may follow the authority
        // directly ("http://h?x").
        std::string_view hostport = s;
        std::string target = "/";
        if (auto cut = s.find_first_of("/?"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            std::string_view rest = s.substr(cut);
            target = rest.front() == '?' ? "/" + std::string(rest)
                                         : std::string(rest);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        if (auto colon = hostport.rfind(':'); colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            port = std::string(hostport.substr(colon + 1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
            for (unsigned char c : port) {
                if (!std::isdigit(c)) return make_err("URL has invalid port");
            }
        } else {
            host = std::string(hostport);
            port = Endpoint::default_port(secure);
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        UrlComponents out;
        out.secure = secure;
        out.host = std::move(host);
        out.port = std::move(port);
        out.target = std::move(target);
        return Result<UrlComponents>::ok(std::move(out));
    }

    namespace url_utils {

        inline Result<UrlComponents> parse_base_url(std::string_view base_url) {
            auto make_err = [&](std::string msg) -> Result<UrlComponents> {
                return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                                  std::move(msg));
            };

            if (base_url.empty()) {
                return make_err("base_url is empty");
            }
            if (!is_absolute_url_with_protocol(base_url)) {
                return make_err("base_url must start with http:// or https://");
            }

            auto parsed = flowhttp::parse_url(base_url);
            if (parsed.has_error()) return parsed;

            UrlComponents b = std::move(parsed.value());

            b.target = trim_trailing_slashes(std::move(b.target));
            if (b.target == "/") b.target.clear();

            if (b.target.find('?') != std::string::npos) {
                return make_err("base_url must not include query parameters");
            }

            return Result<UrlComponents>::ok(std::move(b));
        }

        inline Result<UrlComponents> resolve_url(std::string_view uri_or_url,
                                                 const UrlComponents* base) {
            if (is_absolute_url_with_protocol(uri_or_url)) {
                return flowhttp::parse_url(uri_or_url);
            }

            if (base == nullptr || base->host.empty() || base->port.empty()) {
                return Result<UrlComponents>::err(
                    Error::Code::InvalidUrl,
                    "Relative URI provided but base_url is empty");
            }

            // "" => "/", "health" => "/health"
            std::string_view rel = uri_or_url;
            std::string rel_storage;

            if (rel.empty()) {
                rel = "/";
            } else if (rel.front() != '/') {
                rel_storage.reserve(rel.size() + 1);
                rel_storage.push_back('/');
                rel_storage.append(rel);
                rel = rel_storage;
            }

            UrlComponents out;
            out.secure = base->secure;
            out.host = base->host;
            out.port = base->port;
            out.target.assign(base->target);  // prefix has no trailing '/'
            out.target.append(rel);           // rel begins with '/'
            return Result<UrlComponents>::ok(std::move(out));
        }

        inline Result<UrlComponents> resolve_reference(
            const UrlComponents& base, std::string_view reference) {
            std::string_view ref = reference;
            while (!ref.empty() && (ref.front() == ' ' || ref.front() == '\t'))
                ref.remove_prefix(1);
            while (!ref.empty() && (ref.back() == ' ' || ref.back() == '\t'))
                ref.remove_suffix(1);

            if (auto hash = ref.find('#'); hash != std::string_view::npos) {
                ref = ref.substr(0, hash);
            }

            if (is_absolute_url_with_protocol(ref)) {
                return flowhttp::parse_url(ref);
            }
            if (has_scheme(ref)) {
                return Result<UrlComponents>::err(
                    Error::Code::InvalidUrl,
                    "Unsupported scheme in reference: " + std::string(ref));
            }

            // Network-path reference: "//host[:port]/path"
            if (ref.rfind("//", 0) == 0) {
                std::string absolute = base.secure ? "https:" : "http:";
                absolute.append(ref);
                return flowhttp::parse_url(absolute);
            }

            UrlComponents out;
            out.secure = base.secure;
            out.host = base.host;
            out.port = base.port;

            const std::string_view base_path = base.path();

            if (ref.empty()) {
                out.target = base.target;
            } else if (ref.front() == '/') {
                const auto q = ref.find('?');
                out.target = remove_dot_segments(ref.substr(0, q));
                if (q != std::string_view::npos) out.target.append(ref.substr(q));
            } else if (ref.front() == '?') {
                out.target.assign(base_path);
                out.target.append(ref);
            } else {
                // Merge with the directory of the base path.
                const auto q = ref.find('?');
                std::string merged;
                const auto last_slash = base_path.rfind('/');
                if (last_slash == std::string_view::npos) {
                    merged = "/";
                } else {
                    merged.assign(base_path.substr(0, last_slash + 1));
                }
                merged.append(ref.substr(0, q));
                out.target = remove_dot_segments(merged);
                if (q != std::string_view::npos) out.target.append(ref.substr(q));
            }

            if (out.target.empty()) out.target = "/";
            return Result<UrlComponents>::ok(std::move(out));
        }

    }  // namespace url_utils

}  // namespace flowhttp
