#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "result.hpp"

namespace flowhttp {

    /**
     * @brief Framing-size limits applied to every response.
     *
     * Any frame exceeding a limit is a protocol violation; the exchange
     * fails and its connection is destroyed.
     */
    struct DecoderLimits {
        /** @brief Maximum length of the status line, without CRLF. */
        std::size_t max_initial_line_length{4096};

        /** @brief Maximum total size of the header fields. */
        std::size_t max_header_size{8192};

        /** @brief Maximum size of a single chunk in a chunked body. */
        std::size_t max_chunk_size{8192};

        /** @brief Maximum body size (declared or accumulated). Unlimited when
         * empty. */
        std::optional<std::uint64_t> max_content_length{};

        /** @brief Initial capacity of the decoder input buffer. */
        std::size_t initial_buffer_size{8192};

        /// @brief Check the limits before they are attached to a request.
        Status validate() const {
            auto bad = [](std::string what) {
                return Status::err(Error::Code::InvalidRequest,
                                   "Invalid decoder limits: " + what);
            };
            if (max_initial_line_length == 0)
                return bad("max_initial_line_length must be positive");
            if (max_header_size == 0)
                return bad("max_header_size must be positive");
            if (max_chunk_size == 0)
                return bad("max_chunk_size must be positive");
            if (initial_buffer_size == 0)
                return bad("initial_buffer_size must be positive");
            if (initial_buffer_size > max_initial_line_length + max_header_size +
                                          max_chunk_size)
                return bad("initial_buffer_size exceeds the framing limits");
            return Status::ok();
        }
    };

}  // namespace flowhttp
