#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "../result.hpp"

namespace flowhttp {

    enum class ContentEncoding { Identity, Gzip, Deflate };

    /// @brief Map a Content-Encoding header value to a supported coding.
    /// @return nullopt for codings that cannot be decoded here (e.g. br),
    /// in which case the body is passed through untouched.
    std::optional<ContentEncoding> parse_content_encoding(std::string_view value);

    /// @brief Value sent as Accept-Encoding when compression is enabled.
    inline constexpr const char* kAcceptEncoding = "gzip, deflate";

    /**
     * @brief Streaming zlib inflater for gzip and deflate bodies.
     *
     * decode() may be called with arbitrary slices of the encoded body.
     * Deflate accepts both the zlib-wrapped form and raw deflate, which some
     * servers send.
     */
    class ContentDecoder {
       public:
        explicit ContentDecoder(ContentEncoding encoding);
        ~ContentDecoder();

        ContentDecoder(const ContentDecoder&) = delete;
        ContentDecoder& operator=(const ContentDecoder&) = delete;

        ContentEncoding encoding() const noexcept { return encoding_; }

        /// @brief Inflate `in`, appending the output to `out`.
        Status decode(std::string_view in, std::string& out);

        /// @brief The encoded body ended; fails if the stream is truncated.
        Status finish();

        bool stream_end() const noexcept { return ended_; }

       private:
        struct Stream;

        Status init_(int window_bits);

        ContentEncoding encoding_;
        std::unique_ptr<Stream> zs_;
        bool ended_{false};
        bool raw_fallback_tried_{false};
        bool consumed_any_{false};
    };

}  // namespace flowhttp
