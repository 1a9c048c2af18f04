#include "flowhttp/pipeline/content_decoder.hpp"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstring>

namespace flowhttp {

    namespace {
        std::string to_lower_copy(std::string_view s) {
            std::string out;
            out.reserve(s.size());
            for (unsigned char c : s)
                out.push_back(static_cast<char>(std::tolower(c)));
            return out;
        }

        std::string_view trim(std::string_view s) {
            while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
                s.remove_prefix(1);
            while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
                s.remove_suffix(1);
            return s;
        }
    }  // namespace

    std::optional<ContentEncoding> parse_content_encoding(
        std::string_view value) {
        const std::string lv = to_lower_copy(trim(value));
        if (lv.empty() || lv == "identity") return ContentEncoding::Identity;
        if (lv == "gzip" || lv == "x-gzip") return ContentEncoding::Gzip;
        if (lv == "deflate") return ContentEncoding::Deflate;
        // Stacked or unknown codings are left to the caller.
        return std::nullopt;
    }

    struct ContentDecoder::Stream {
        z_stream zs;
        bool live{false};

        Stream() { std::memset(&zs, 0, sizeof(zs)); }
        ~Stream() {
            if (live) inflateEnd(&zs);
        }
    };

    ContentDecoder::ContentDecoder(ContentEncoding encoding)
        : encoding_(encoding) {}

    ContentDecoder::~ContentDecoder() = default;

    Status ContentDecoder::init_(int window_bits) {
        zs_ = std::make_unique<Stream>();
        if (inflateInit2(&zs_->zs, window_bits) != Z_OK) {
            zs_.reset();
            return Status::err(Error::Code::ProtocolViolation,
                               "Failed to initialise the inflater");
        }
        zs_->live = true;
        return Status::ok();
    }

    Status ContentDecoder::decode(std::string_view in, std::string& out) {
        if (encoding_ == ContentEncoding::Identity) {
            out.append(in.data(), in.size());
            return Status::ok();
        }
        if (in.empty()) return Status::ok();
        if (ended_) {
            return Status::err(Error::Code::ProtocolViolation,
                               "Data after the end of the compressed body");
        }

        if (!zs_) {
            auto st = init_(encoding_ == ContentEncoding::Gzip ? 16 + MAX_WBITS
                                                                : MAX_WBITS);
            if (st.has_error()) return st;
        }

        auto& zs = zs_->zs;
        zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
        zs.avail_in = static_cast<uInt>(in.size());

        char buf[16384];
        for (;;) {
            zs.next_out = reinterpret_cast<Bytef*>(buf);
            zs.avail_out = sizeof(buf);
            const int ret = inflate(&zs, Z_NO_FLUSH);

            if (ret == Z_DATA_ERROR && encoding_ == ContentEncoding::Deflate &&
                !consumed_any_ && !raw_fallback_tried_) {
                // Not zlib-wrapped; retry the same input as raw deflate.
                raw_fallback_tried_ = true;
                auto st = init_(-MAX_WBITS);
                if (st.has_error()) return st;
                return decode(in, out);
            }
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                return Status::err(Error::Code::ProtocolViolation,
                                   std::string("Corrupt compressed body: ") +
                                       (zs.msg ? zs.msg : "inflate error"));
            }

            const std::size_t produced = sizeof(buf) - zs.avail_out;
            if (produced) out.append(buf, produced);
            consumed_any_ = true;

            if (ret == Z_STREAM_END) {
                ended_ = true;
                break;
            }
            if (ret == Z_BUF_ERROR && produced == 0) break;
            // A full output buffer may leave inflated bytes behind.
            if (zs.avail_in == 0 && zs.avail_out != 0) break;
        }

        if (ended_ && zs.avail_in > 0) {
            return Status::err(Error::Code::ProtocolViolation,
                               "Data after the end of the compressed body");
        }
        return Status::ok();
    }

    Status ContentDecoder::finish() {
        if (encoding_ == ContentEncoding::Identity || ended_) {
            return Status::ok();
        }
        if (!zs_) {
            // Empty body.
            return Status::ok();
        }
        return Status::err(Error::Code::ProtocolViolation,
                           "Compressed body is truncated");
    }

}  // namespace flowhttp
