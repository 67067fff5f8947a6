#ifndef WXSTREAM_TRANSPORT_STREAM_TRANSPORT_CONFIG_HPP
#define WXSTREAM_TRANSPORT_STREAM_TRANSPORT_CONFIG_HPP

#include "wxstream/stream/incremental_buffer.hpp"
#include "wxstream/transport/http_client.hpp"
#include "wxstream/transport/http_types.hpp"

#include <chrono>
#include <string>

namespace wxstream {

// ─────────────────────────────────────────────────────────────────────────────
// TLS
// ─────────────────────────────────────────────────────────────────────────────

struct TlsConfig {
    // PEM bundle; empty uses the system trust store
    std::string ca_cert_path;

    // Never disable outside local development
    bool verify_peer{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// StreamTransportConfig
// ─────────────────────────────────────────────────────────────────────────────
// Per-connection settings shared by EventSource and RagStreamSession.

struct StreamTransportConfig {
    // Sent with every request, after the stream's own Accept/Cache-Control
    HeaderMap default_headers;

    std::chrono::milliseconds connect_timeout{10'000};

    // No bytes (not even a heartbeat comment) for this long counts as a lost
    // connection. Zero leaves a silent connection open indefinitely.
    std::chrono::milliseconds stall_timeout{0};

    TlsConfig tls;

    IncrementalBufferConfig buffer;

    StreamTransportConfig& with_header(const std::string& name, const std::string& value);
    StreamTransportConfig& with_connect_timeout(std::chrono::milliseconds timeout);
    StreamTransportConfig& with_stall_timeout(std::chrono::milliseconds timeout);
    StreamTransportConfig& with_verify_ssl(bool verify);
    StreamTransportConfig& with_ca_cert(const std::string& path);
    StreamTransportConfig& with_max_buffer_size(std::size_t bytes);

    /// Applies everything except the base URL to a fresh client.
    void apply_to(IHttpClient& client) const;
};

}  // namespace wxstream

#endif  // WXSTREAM_TRANSPORT_STREAM_TRANSPORT_CONFIG_HPP
