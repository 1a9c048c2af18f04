#pragma once

#include <utility>  // before awaitable.hpp: Boost 1.74 uses std::exchange without it
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "result.hpp"

namespace flowhttp {

    /**
     * @brief Lazy source of request body chunks.
     *
     * next() yields chunks in order and an empty optional at the end. An
     * error aborts the exchange and the connection is not reused. A
     * restartable producer can be rewound to replay the same bytes, which is
     * what redirect following (307/308) and idempotent retry require.
     */
    class BodyProducer {
       public:
        virtual ~BodyProducer() = default;

        virtual boost::asio::awaitable<Result<std::optional<std::string>>>
        next() = 0;

        virtual bool restartable() const noexcept = 0;

        /// @brief Rewind to the first chunk. Only valid when restartable().
        virtual void restart() = 0;

        /// @brief Total size in bytes if known up front. A known size is sent
        /// as Content-Length, otherwise the body is chunked.
        virtual std::optional<std::uint64_t> size() const noexcept {
            return std::nullopt;
        }
    };

    /// @brief In-memory body; restartable.
    class StringBodyProducer : public BodyProducer {
       public:
        explicit StringBodyProducer(std::string body)
            : body_(std::move(body)) {}

        boost::asio::awaitable<Result<std::optional<std::string>>> next()
            override {
            if (done_ || body_.empty()) {
                done_ = true;
                co_return Result<std::optional<std::string>>::ok(std::nullopt);
            }
            done_ = true;
            co_return Result<std::optional<std::string>>::ok(body_);
        }

        bool restartable() const noexcept override { return true; }
        void restart() override { done_ = false; }

        std::optional<std::uint64_t> size() const noexcept override {
            return body_.size();
        }

       private:
        std::string body_;
        bool done_{false};
    };

    /// @brief Fixed sequence of chunks of unknown total size (sent chunked);
    /// restartable.
    class ChunksBodyProducer : public BodyProducer {
       public:
        explicit ChunksBodyProducer(std::vector<std::string> chunks)
            : chunks_(std::move(chunks)) {}

        boost::asio::awaitable<Result<std::optional<std::string>>> next()
            override {
            while (pos_ < chunks_.size() && chunks_[pos_].empty()) ++pos_;
            if (pos_ >= chunks_.size()) {
                co_return Result<std::optional<std::string>>::ok(std::nullopt);
            }
            co_return Result<std::optional<std::string>>::ok(chunks_[pos_++]);
        }

        bool restartable() const noexcept override { return true; }
        void restart() override { pos_ = 0; }

       private:
        std::vector<std::string> chunks_;
        std::size_t pos_{0};
    };

    /// @brief Body pulled from a callback, one chunk per call. Not
    /// restartable.
    class GeneratorBodyProducer : public BodyProducer {
       public:
        using Generator = std::function<Result<std::optional<std::string>>()>;

        explicit GeneratorBodyProducer(Generator gen) : gen_(std::move(gen)) {}

        boost::asio::awaitable<Result<std::optional<std::string>>> next()
            override {
            if (!gen_) {
                co_return Result<std::optional<std::string>>::ok(std::nullopt);
            }
            co_return gen_();
        }

        bool restartable() const noexcept override { return false; }

        void restart() override {}

       private:
        Generator gen_;
    };

    inline std::shared_ptr<BodyProducer> string_body(std::string body) {
        return std::make_shared<StringBodyProducer>(std::move(body));
    }

    inline std::shared_ptr<BodyProducer> chunks_body(
        std::vector<std::string> chunks) {
        return std::make_shared<ChunksBodyProducer>(std::move(chunks));
    }

    inline std::shared_ptr<BodyProducer> generator_body(
        GeneratorBodyProducer::Generator gen) {
        return std::make_shared<GeneratorBodyProducer>(std::move(gen));
    }

}  // namespace flowhttp
