#include "flowhttp/pipeline/request_writer.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http/chunk_encode.hpp>
#include <charconv>

#include "flowhttp/pipeline/content_decoder.hpp"

namespace flowhttp {

    namespace asio = boost::asio;
    namespace beast = boost::beast;

    namespace {
        bool has_crlf(beast::string_view s) {
            for (char c : s) {
                if (c == '\r' || c == '\n') return true;
            }
            return false;
        }

        void append_field(std::string& out, std::string_view name,
                          std::string_view value) {
            out.append(name.data(), name.size());
            out += ": ";
            out.append(value.data(), value.size());
            out += "\r\n";
        }

        bool expects_body(HttpMethod m) {
            return m == HttpMethod::Post || m == HttpMethod::Put ||
                   m == HttpMethod::Patch;
        }
    }  // namespace

    Result<SerializedHead> serialize_head(const RequestDescriptor& req,
                                          const RequestWriterOptions& opt) {
        if (to_boost_http_method(req.method) == http::verb::unknown) {
            return Result<SerializedHead>::err(Error::Code::InvalidRequest,
                                               "Unknown HTTP method");
        }

        auto invalid = [](std::string what) {
            return Result<SerializedHead>::err(Error::Code::InvalidRequest,
                                               std::move(what));
        };

        for (auto const& f : req.headers) {
            if (has_crlf(f.name_string()) || has_crlf(f.value())) {
                return invalid("Header contains CR or LF: " +
                               std::string(f.name_string()));
            }
        }
        if (req.uri.target.find_first_of("\r\n ") != std::string::npos) {
            return invalid("Request target contains whitespace");
        }

        SerializedHead out;
        std::string& h = out.bytes;
        h.reserve(256);

        const auto method = to_string(req.method);
        h.append(method.data(), method.size());
        h += ' ';
        h += req.uri.target.empty() ? std::string("/") : req.uri.target;
        h += " HTTP/1.1\r\n";

        auto has = [&](http::field f) {
            return req.headers.find(f) != req.headers.end();
        };

        if (!has(http::field::host)) {
            append_field(h, "Host", req.endpoint().authority());
        }
        if (!has(http::field::user_agent) && !opt.user_agent.empty()) {
            append_field(h, "User-Agent", opt.user_agent);
        }
        for (auto const& [name, value] : opt.default_headers) {
            if (req.headers.find(name) == req.headers.end()) {
                append_field(h, name, value);
            }
        }
        if (opt.compress && !has(http::field::accept_encoding)) {
            append_field(h, "Accept-Encoding", kAcceptEncoding);
        }

        for (auto const& f : req.headers) {
            // Framing is ours to decide.
            if (f.name() == http::field::transfer_encoding) continue;
            append_field(h, std::string_view(f.name_string().data(),
                                             f.name_string().size()),
                         std::string_view(f.value().data(), f.value().size()));
        }

        if (!req.keep_alive && !has(http::field::connection)) {
            append_field(h, "Connection", "close");
        }

        if (req.explicit_content_length) {
            const auto v = req.headers[http::field::content_length];
            std::uint64_t n = 0;
            auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
            if (ec != std::errc() || p != v.data() + v.size()) {
                return invalid("Invalid Content-Length: " + std::string(v));
            }
            if (!req.body && n != 0) {
                return invalid("Content-Length " + std::to_string(n) +
                               " given for a request without body");
            }
            out.framing = req.body ? BodyFraming::ContentLength
                                   : BodyFraming::None;
            out.content_length = n;
        } else if (req.body) {
            if (auto size = req.body->size()) {
                append_field(h, "Content-Length", std::to_string(*size));
                out.framing = BodyFraming::ContentLength;
                out.content_length = *size;
            } else {
                append_field(h, "Transfer-Encoding", "chunked");
                out.framing = BodyFraming::Chunked;
            }
        } else if (expects_body(req.method)) {
            append_field(h, "Content-Length", "0");
        }

        h += "\r\n";
        return Result<SerializedHead>::ok(std::move(out));
    }

    asio::awaitable<WriteResult> write_request(Transport& transport,
                                               const RequestDescriptor& req,
                                               const RequestWriterOptions& opt) {
        WriteResult result;

        auto head = serialize_head(req, opt);
        if (head.has_error()) {
            result.status = Status::err(head.error());
            co_return result;
        }
        const SerializedHead& sh = head.value();

        auto send = [&](std::string_view bytes)
            -> asio::awaitable<bool> {
            auto ec = co_await transport.write(bytes);
            if (ec) {
                result.transport_error = true;
                result.status = Status::err(Error::Code::Aborted,
                                            "Write failed: " + ec.message());
                co_return false;
            }
            result.bytes += bytes.size();
            co_return true;
        };

        if (!co_await send(sh.bytes)) co_return result;
        if (sh.framing == BodyFraming::None) co_return result;

        auto& body = *req.body;
        if (body.restartable()) body.restart();

        std::uint64_t body_bytes = 0;
        for (;;) {
            auto chunk = co_await body.next();
            if (chunk.has_error()) {
                SPDLOG_DEBUG("Request body producer failed: {}",
                             chunk.error().message);
                result.status = Status::err(
                    Error::Code::Aborted,
                    "Request body failed: " + chunk.error().message);
                co_return result;
            }
            auto& data = chunk.value();
            if (!data) break;
            if (data->empty()) continue;

            body_bytes += data->size();
            if (sh.framing == BodyFraming::ContentLength) {
                if (body_bytes > sh.content_length) {
                    result.status = Status::err(
                        Error::Code::InvalidRequest,
                        "Request body exceeds its Content-Length");
                    co_return result;
                }
                if (!co_await send(*data)) co_return result;
            } else {
                const auto framed = beast::buffers_to_string(
                    beast::http::make_chunk(asio::buffer(*data)));
                if (!co_await send(framed)) co_return result;
            }
        }

        if (sh.framing == BodyFraming::Chunked) {
            const auto last =
                beast::buffers_to_string(beast::http::make_chunk_last());
            if (!co_await send(last)) co_return result;
        } else if (body_bytes != sh.content_length) {
            result.status =
                Status::err(Error::Code::InvalidRequest,
                            "Request body is shorter than its Content-Length");
        }
        co_return result;
    }

}  // namespace flowhttp
