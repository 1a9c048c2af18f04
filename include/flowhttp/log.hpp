#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace flowhttp {

    /// @brief Name of the logger that receives wiretap output.
    inline constexpr const char* kWireLoggerName = "flowhttp.wire";

    /// @brief Logger for wiretap output. Registered on first use as a clone
    /// of the default logger, so it shares its sinks.
    std::shared_ptr<spdlog::logger> wire_logger();

    /// @brief Printable preview of raw bytes: control characters escaped,
    /// truncated to `max_len` input bytes.
    std::string escape_preview(std::string_view bytes, std::size_t max_len = 96);

}  // namespace flowhttp
