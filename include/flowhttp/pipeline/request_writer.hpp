#pragma once

#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "../request.hpp"
#include "../result.hpp"
#include "../transport/transport.hpp"

namespace flowhttp {

    /// @brief Client-wide values merged into every serialized request.
    struct RequestWriterOptions {
        std::string user_agent;
        std::map<std::string, std::string> default_headers;
        /// Advertise gzip/deflate unless the request sets Accept-Encoding.
        bool compress{false};
    };

    enum class BodyFraming { None, ContentLength, Chunked };

    /// @brief Serialized request line and header block, plus how the body
    /// follows it.
    struct SerializedHead {
        std::string bytes;
        BodyFraming framing{BodyFraming::None};
        std::uint64_t content_length{0};
    };

    /// @brief Build the request head. Fails with InvalidRequest on CR/LF in
    /// a header, an unparsable Content-Length or an unknown method.
    Result<SerializedHead> serialize_head(const RequestDescriptor& req,
                                          const RequestWriterOptions& opt);

    struct WriteResult {
        Status status{Status::ok()};
        /// The transport failed (as opposed to the request or its body).
        bool transport_error{false};
        std::uint64_t bytes{0};
    };

    /// @brief Serialize `req` and write it, head first, then the body
    /// producer's chunks in order. The producer is restarted first when it
    /// is restartable.
    boost::asio::awaitable<WriteResult> write_request(
        Transport& transport, const RequestDescriptor& req,
        const RequestWriterOptions& opt);

}  // namespace flowhttp
