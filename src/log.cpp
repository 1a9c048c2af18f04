#include "flowhttp/log.hpp"

#include <algorithm>
#include <cstdio>

namespace flowhttp {

    std::shared_ptr<spdlog::logger> wire_logger() {
        if (auto existing = spdlog::get(kWireLoggerName)) return existing;

        auto logger = spdlog::default_logger()->clone(kWireLoggerName);
        try {
            spdlog::register_logger(logger);
        } catch (const spdlog::spdlog_ex&) {
            // Registered concurrently by another thread.
            if (auto existing = spdlog::get(kWireLoggerName)) return existing;
        }
        return logger;
    }

    std::string escape_preview(std::string_view bytes, std::size_t max_len) {
        std::string out;
        const auto n = std::min(bytes.size(), max_len);
        out.reserve(n + 8);
        for (std::size_t i = 0; i < n; ++i) {
            const auto c = static_cast<unsigned char>(bytes[i]);
            switch (c) {
                case '\r':
                    out += "\\r";
                    break;
                case '\n':
                    out += "\\n";
                    break;
                case '\t':
                    out += "\\t";
                    break;
                default:
                    if (c < 0x20 || c >= 0x7f) {
                        char hex[5];
                        std::snprintf(hex, sizeof(hex), "\\x%02x", c);
                        out += hex;
                    } else {
                        out.push_back(static_cast<char>(c));
                    }
            }
        }
        if (bytes.size() > max_len) out += "...";
        return out;
    }

}  // namespace flowhttp
