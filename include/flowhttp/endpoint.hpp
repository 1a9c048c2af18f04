#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace flowhttp {

    /**
     * @brief Logical remote target: (host, port, security flag).
     *
     * Immutable once constructed. The host is lower-cased and an empty port
     * is replaced by the scheme default, so two endpoints naming the same
     * target compare equal and hash identically. Used as the connection
     * pool's partition key.
     */
    class Endpoint {
       public:
        Endpoint() = default;

        Endpoint(std::string host, std::string port, bool secure)
            : host_(std::move(host)), port_(std::move(port)), secure_(secure) {
            if (host_.empty()) host_ = "localhost";
            std::transform(host_.begin(), host_.end(), host_.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            if (port_.empty()) port_ = default_port(secure_);
        }

        const std::string& host() const noexcept { return host_; }
        const std::string& port() const noexcept { return port_; }
        bool secure() const noexcept { return secure_; }

        /// @brief True for a default-constructed (unset) endpoint.
        bool empty() const noexcept { return host_.empty(); }

        /// @brief Value for the Host request header; the port is omitted when
        /// it is the scheme default.
        std::string authority() const {
            if (port_ == default_port(secure_)) return host_;
            return host_ + ":" + port_;
        }

        /// @brief "http://host:port" or "https://host:port".
        std::string to_string() const {
            return std::string(secure_ ? "https://" : "http://") + host_ + ":" +
                   port_;
        }

        static const char* default_port(bool secure) noexcept {
            return secure ? "443" : "80";
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.secure_ == b.secure_ && a.host_ == b.host_ &&
                   a.port_ == b.port_;
        }

        friend bool operator!=(Endpoint const& a, Endpoint const& b) noexcept {
            return !(a == b);
        }

       private:
        std::string host_;
        std::string port_;
        bool secure_{false};
    };

}  // namespace flowhttp

namespace std {
    template <>
    struct hash<flowhttp::Endpoint> {
        size_t operator()(flowhttp::Endpoint const& e) const noexcept {
            // FNV-1a over the normalized fields.
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
            };
            h ^= static_cast<size_t>(e.secure());
            h *= 1099511628211ull;
            mix(e.host());
            mix(e.port());
            return h;
        }
    };
}  // namespace std
