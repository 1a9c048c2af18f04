#include "flowhttp/metrics/metrics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace flowhttp {

    // -------------------------
    // InMemoryMetricsRecorder
    // -------------------------

    void InMemoryMetricsRecorder::record_connection_established(
        const Endpoint& /*ep*/, std::chrono::nanoseconds connect_time) {
        std::lock_guard<std::mutex> lk(mu_);
        ++data_.connections_established;
        data_.connect_time += connect_time;
    }

    void InMemoryMetricsRecorder::record_connection_closed(
        const Endpoint& /*ep*/) {
        std::lock_guard<std::mutex> lk(mu_);
        ++data_.connections_closed;
    }

    void InMemoryMetricsRecorder::record_tls_handshake(
        const Endpoint& /*ep*/, std::chrono::nanoseconds duration,
        bool success) {
        std::lock_guard<std::mutex> lk(mu_);
        ++data_.tls_handshakes;
        if (!success) ++data_.tls_handshake_failures;
        data_.tls_handshake_time += duration;
    }

    void InMemoryMetricsRecorder::record_bytes_sent(const Endpoint& /*ep*/,
                                                    std::string_view uri,
                                                    std::uint64_t bytes) {
        std::lock_guard<std::mutex> lk(mu_);
        data_.bytes_sent += bytes;
        data_.by_uri[std::string(uri)].bytes_sent += bytes;
    }

    void InMemoryMetricsRecorder::record_bytes_received(const Endpoint& /*ep*/,
                                                        std::string_view uri,
                                                        std::uint64_t bytes) {
        std::lock_guard<std::mutex> lk(mu_);
        data_.bytes_received += bytes;
        data_.by_uri[std::string(uri)].bytes_received += bytes;
    }

    void InMemoryMetricsRecorder::record_request_complete(
        const Endpoint& /*ep*/, std::string_view uri,
        std::string_view /*method*/, int status,
        std::chrono::nanoseconds total) {
        std::lock_guard<std::mutex> lk(mu_);
        ++data_.requests_completed;
        ++data_.responses_by_status[status];
        auto& u = data_.by_uri[std::string(uri)];
        ++u.requests;
        u.total_time += total;
        u.max_time = std::max(u.max_time, total);
    }

    void InMemoryMetricsRecorder::record_error(const Endpoint& /*ep*/,
                                               std::string_view uri,
                                               Error::Code code) {
        std::lock_guard<std::mutex> lk(mu_);
        ++data_.errors;
        ++data_.errors_by_code[code];
        ++data_.by_uri[std::string(uri)].errors;
    }

    DataMetricsSnapshot InMemoryMetricsRecorder::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return data_;
    }

    // -------------------------
    // URI tagging
    // -------------------------

    std::string numeric_segment_tagger(std::string_view path) {
        path = path.substr(0, path.find('?'));

        std::string out;
        out.reserve(path.size());
        std::size_t i = 0;
        while (i < path.size()) {
            if (path[i] == '/') {
                out.push_back('/');
                ++i;
                continue;
            }
            const auto end = std::min(path.find('/', i), path.size());
            const auto seg = path.substr(i, end - i);
            const bool numeric =
                std::all_of(seg.begin(), seg.end(), [](unsigned char c) {
                    return std::isdigit(c) != 0;
                });
            if (numeric) {
                out += "{id}";
            } else {
                out.append(seg);
            }
            i = end;
        }
        return out.empty() ? std::string("/") : out;
    }

    // -------------------------
    // MetricsDispatcher
    // -------------------------

    MetricsDispatcher::MetricsDispatcher(
        std::shared_ptr<MetricsRecorder> recorder, UriTagger tagger,
        bool enabled)
        : recorder_(enabled ? std::move(recorder) : nullptr),
          tagger_(std::move(tagger)) {}

    template <typename F>
    void MetricsDispatcher::dispatch(const char* event, F&& f) {
        if (!recorder_) return;
        try {
            f(*recorder_);
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_WARN("Metrics recorder failed on {}: {}", event, e.what());
        } catch (...) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_WARN("Metrics recorder failed on {}: unknown exception",
                        event);
        }
    }

    std::string MetricsDispatcher::tag(std::string_view path) const {
        if (!tagger_) return std::string(path.substr(0, path.find('?')));
        try {
            return tagger_(path);
        } catch (const std::exception& e) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_WARN("URI tagger failed for '{}': {}", path, e.what());
        } catch (...) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            SPDLOG_WARN("URI tagger failed for '{}': unknown exception", path);
        }
        return std::string(path.substr(0, path.find('?')));
    }

    void MetricsDispatcher::connection_established(
        const Endpoint& ep, std::chrono::nanoseconds connect_time) {
        dispatch("connection_established", [&](MetricsRecorder& r) {
            r.record_connection_established(ep, connect_time);
        });
    }

    void MetricsDispatcher::connection_closed(const Endpoint& ep) {
        dispatch("connection_closed",
                 [&](MetricsRecorder& r) { r.record_connection_closed(ep); });
    }

    void MetricsDispatcher::tls_handshake(const Endpoint& ep,
                                          std::chrono::nanoseconds duration,
                                          bool success) {
        dispatch("tls_handshake", [&](MetricsRecorder& r) {
            r.record_tls_handshake(ep, duration, success);
        });
    }

    void MetricsDispatcher::bytes_sent(const Endpoint& ep,
                                       std::string_view path,
                                       std::uint64_t bytes) {
        if (!recorder_) return;
        const auto uri = tag(path);
        dispatch("bytes_sent", [&](MetricsRecorder& r) {
            r.record_bytes_sent(ep, uri, bytes);
        });
    }

    void MetricsDispatcher::bytes_received(const Endpoint& ep,
                                           std::string_view path,
                                           std::uint64_t bytes) {
        if (!recorder_) return;
        const auto uri = tag(path);
        dispatch("bytes_received", [&](MetricsRecorder& r) {
            r.record_bytes_received(ep, uri, bytes);
        });
    }

    void MetricsDispatcher::request_complete(const Endpoint& ep,
                                             std::string_view path,
                                             std::string_view method,
                                             int status,
                                             std::chrono::nanoseconds total) {
        if (!recorder_) return;
        const auto uri = tag(path);
        dispatch("request_complete", [&](MetricsRecorder& r) {
            r.record_request_complete(ep, uri, method, status, total);
        });
    }

    void MetricsDispatcher::error(const Endpoint& ep, std::string_view path,
                                  Error::Code code) {
        if (!recorder_) return;
        const auto uri = tag(path);
        dispatch("error",
                 [&](MetricsRecorder& r) { r.record_error(ep, uri, code); });
    }

}  // namespace flowhttp
