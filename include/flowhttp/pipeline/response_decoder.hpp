#pragma once

#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/basic_parser.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "../decoder_limits.hpp"
#include "../response.hpp"
#include "../result.hpp"

namespace flowhttp {

    /**
     * @brief Incremental HTTP/1.1 response decoder enforcing DecoderLimits.
     *
     * Raw connection bytes go in through feed(); the decoded body (chunk
     * framing removed, content encoding untouched) is appended to the
     * caller's string. Interim 1xx responses other than 101 are skipped.
     * Every framing or limit error is a ProtocolViolation and is sticky.
     */
    class ResponseDecoder {
       public:
        ResponseDecoder(DecoderLimits limits, bool head_request);
        ~ResponseDecoder();

        ResponseDecoder(const ResponseDecoder&) = delete;
        ResponseDecoder& operator=(const ResponseDecoder&) = delete;

        /// @brief Consume `bytes`. Body bytes are appended to `body_out`.
        Status feed(std::string_view bytes, std::string& body_out);

        /// @brief The peer closed the stream cleanly. Completes a
        /// close-delimited body; a message cut short is Aborted.
        Status finish(std::string& body_out);

        bool header_done() const noexcept;
        bool done() const noexcept;

        /// @brief Both the response version and its Connection header allow
        /// another message on this connection.
        bool keep_alive() const noexcept;
        bool upgrade() const noexcept;

        /// @brief Bytes received beyond the end of the message.
        std::size_t leftover() const noexcept {
            return buffer_.size() + overflow_;
        }

        std::uint64_t body_bytes() const noexcept { return body_bytes_; }

        /// @brief Head of the final response. Valid once header_done().
        const ResponseHead& head() const noexcept { return head_; }

        const DecoderLimits& limits() const noexcept { return limits_; }

       private:
        class Parser;

        void reset_parser_();
        Status drain_(std::string& body_out);
        Status check_initial_line_();
        Status violation_(std::string message);

        DecoderLimits limits_;
        bool head_request_;
        std::unique_ptr<Parser> parser_;
        boost::beast::flat_buffer buffer_;
        ResponseHead head_;

        std::size_t header_bytes_{0};
        std::uint64_t body_bytes_{0};
        std::size_t overflow_{0};
        std::string* body_out_{nullptr};
        std::string violation_message_;
        std::optional<Error> error_;
    };

}  // namespace flowhttp
