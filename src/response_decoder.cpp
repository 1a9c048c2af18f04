#include "flowhttp/pipeline/response_decoder.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <limits>

namespace flowhttp {

    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;

    class ResponseDecoder::Parser : public http::basic_parser<false> {
       public:
        explicit Parser(ResponseDecoder& owner) : owner_(owner) {}

       private:
        void on_request_impl(http::verb, beast::string_view, beast::string_view,
                             int, beast::error_code&) override {}

        void on_response_impl(int code, beast::string_view reason, int version,
                              beast::error_code&) override {
            owner_.head_.status = code;
            owner_.head_.reason.assign(reason.data(), reason.size());
            owner_.head_.version = static_cast<unsigned>(version);
        }

        void on_field_impl(http::field, beast::string_view name,
                           beast::string_view value,
                           beast::error_code& ec) override {
            // name ": " value CRLF
            owner_.header_bytes_ += name.size() + value.size() + 4;
            if (owner_.header_bytes_ > owner_.limits_.max_header_size) {
                owner_.violation_message_ =
                    "Response header block exceeds " +
                    std::to_string(owner_.limits_.max_header_size) + " bytes";
                ec = http::error::header_limit;
                return;
            }
            owner_.head_.headers.insert(name, value);
        }

        void on_header_impl(beast::error_code&) override {}

        void on_body_init_impl(boost::optional<std::uint64_t> const&,
                               beast::error_code&) override {}

        std::size_t on_body_impl(beast::string_view body,
                                 beast::error_code&) override {
            append(body);
            return body.size();
        }

        void on_chunk_header_impl(std::uint64_t size, beast::string_view,
                                  beast::error_code& ec) override {
            if (size > owner_.limits_.max_chunk_size) {
                owner_.violation_message_ =
                    "Chunk of " + std::to_string(size) + " bytes exceeds " +
                    std::to_string(owner_.limits_.max_chunk_size) + " bytes";
                ec = http::error::bad_chunk;
            }
        }

        std::size_t on_chunk_body_impl(std::uint64_t, beast::string_view body,
                                       beast::error_code&) override {
            append(body);
            return body.size();
        }

        void on_finish_impl(beast::error_code&) override {}

        void append(beast::string_view body) {
            owner_.body_bytes_ += body.size();
            if (owner_.body_out_) owner_.body_out_->append(body.data(), body.size());
        }

        ResponseDecoder& owner_;
    };

    ResponseDecoder::ResponseDecoder(DecoderLimits limits, bool head_request)
        : limits_(limits), head_request_(head_request) {
        buffer_.reserve(limits_.initial_buffer_size);
        reset_parser_();
    }

    ResponseDecoder::~ResponseDecoder() = default;

    void ResponseDecoder::reset_parser_() {
        parser_ = std::make_unique<Parser>(*this);
        parser_->eager(true);
        parser_->skip(head_request_);

        const std::uint64_t header_limit = static_cast<std::uint64_t>(
            limits_.max_initial_line_length) + limits_.max_header_size + 4;
        parser_->header_limit(static_cast<std::uint32_t>(std::min<std::uint64_t>(
            header_limit, std::numeric_limits<std::uint32_t>::max())));

        if (limits_.max_content_length) {
            parser_->body_limit(*limits_.max_content_length);
        } else {
            // Boost 1.74 compares len_ > body_limit_ even when it is none,
            // which always trips; the maximum value means "unlimited".
            parser_->body_limit(std::numeric_limits<std::uint64_t>::max());
        }

        head_ = ResponseHead{};
        header_bytes_ = 0;
    }

    bool ResponseDecoder::header_done() const noexcept {
        return parser_->is_header_done();
    }

    bool ResponseDecoder::done() const noexcept { return parser_->is_done(); }

    bool ResponseDecoder::keep_alive() const noexcept {
        return parser_->is_header_done() && parser_->keep_alive();
    }

    bool ResponseDecoder::upgrade() const noexcept {
        return parser_->is_header_done() && parser_->upgrade();
    }

    Status ResponseDecoder::feed(std::string_view bytes, std::string& body_out) {
        if (error_) return Status::err(*error_);
        if (bytes.empty()) return Status::ok();

        if (parser_->is_done()) {
            overflow_ += bytes.size();
            return Status::ok();
        }

        auto dst = buffer_.prepare(bytes.size());
        asio::buffer_copy(dst, asio::buffer(bytes.data(), bytes.size()));
        buffer_.commit(bytes.size());
        return drain_(body_out);
    }

    Status ResponseDecoder::finish(std::string& body_out) {
        if (error_) return Status::err(*error_);
        if (parser_->is_done()) return Status::ok();

        if (!parser_->is_header_done() && buffer_.size() == 0 &&
            !parser_->got_some()) {
            error_ = Error{Error::Code::Aborted,
                           "Connection closed before a response was received"};
            return Status::err(*error_);
        }

        beast::error_code ec;
        body_out_ = &body_out;
        parser_->put_eof(ec);
        body_out_ = nullptr;

        if (ec == http::error::partial_message) {
            error_ = Error{Error::Code::Aborted,
                           "Connection closed in the middle of a response"};
            return Status::err(*error_);
        }
        if (ec) {
            return violation_("Malformed response: " + ec.message());
        }
        return Status::ok();
    }

    Status ResponseDecoder::drain_(std::string& body_out) {
        body_out_ = &body_out;
        Status st = Status::ok();

        while (buffer_.size() > 0 && !parser_->is_done()) {
            if (!parser_->is_header_done()) {
                st = check_initial_line_();
                if (st.has_error()) break;
            }

            beast::error_code ec;
            const std::size_t used = parser_->put(buffer_.data(), ec);
            buffer_.consume(used);

            if (ec == http::error::need_more) break;
            if (ec) {
                if (!violation_message_.empty()) {
                    st = violation_(violation_message_);
                } else if (ec == http::error::header_limit) {
                    st = violation_("Response head exceeds the decoder limits");
                } else if (ec == http::error::body_limit) {
                    st = violation_("Response body exceeds " +
                                    std::to_string(limits_.max_content_length
                                                       .value_or(0)) +
                                    " bytes");
                } else {
                    st = violation_("Malformed response: " + ec.message());
                }
                break;
            }

            if (parser_->is_done()) {
                const int status = head_.status;
                if (status / 100 == 1 && status != 101) {
                    SPDLOG_DEBUG("Skipping interim {} response", status);
                    reset_parser_();
                    continue;
                }
                break;
            }
            if (used == 0) break;
        }

        body_out_ = nullptr;
        return st;
    }

    Status ResponseDecoder::check_initial_line_() {
        const auto data = buffer_.data();
        const std::string_view s(static_cast<const char*>(data.data()),
                                 data.size());
        const auto max = limits_.max_initial_line_length;
        const auto eol = s.find("\r\n");

        // One byte of slack for a CR whose LF has not arrived yet.
        if ((eol != std::string_view::npos && eol > max) ||
            (eol == std::string_view::npos && s.size() > max + 1)) {
            return violation_("Status line exceeds " + std::to_string(max) +
                              " bytes");
        }
        return Status::ok();
    }

    Status ResponseDecoder::violation_(std::string message) {
        SPDLOG_WARN("Protocol violation: {}", message);
        error_ = Error{Error::Code::ProtocolViolation, std::move(message)};
        return Status::err(*error_);
    }

}  // namespace flowhttp
