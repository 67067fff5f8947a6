#include "wxstream/transport/stream_transport_config.hpp"

namespace wxstream {

StreamTransportConfig& StreamTransportConfig::with_header(const std::string& name, const std::string& value) {
    default_headers[name] = value;
    return *this;
}

StreamTransportConfig& StreamTransportConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

StreamTransportConfig& StreamTransportConfig::with_stall_timeout(std::chrono::milliseconds timeout) {
    stall_timeout = timeout;
    return *this;
}

StreamTransportConfig& StreamTransportConfig::with_verify_ssl(bool verify) {
    tls.verify_peer = verify;
    return *this;
}

StreamTransportConfig& StreamTransportConfig::with_ca_cert(const std::string& path) {
    tls.ca_cert_path = path;
    return *this;
}

StreamTransportConfig& StreamTransportConfig::with_max_buffer_size(std::size_t bytes) {
    buffer.max_buffer_size = bytes;
    return *this;
}

void StreamTransportConfig::apply_to(IHttpClient& client) const {
    client.set_default_headers(default_headers);
    client.set_connect_timeout(connect_timeout);
    client.set_stall_timeout(stall_timeout);
    client.set_verify_ssl(tls.verify_peer);
    client.set_ca_cert_path(tls.ca_cert_path);
}

}  // namespace wxstream
