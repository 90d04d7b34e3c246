#pragma once

#include <pushgw/http/transport.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <memory>
#include <string>

namespace pushgw::http
{

// ============================================================================
// Beast Transport
// ============================================================================

/// HTTP/1.1 over one persistent connection (plain TCP, or TLS for https).
/// The connection is opened on the first request and kept while the server
/// allows it. Any failure closes it so the next request starts fresh.
class beast_transport : public transport
{
public:
    explicit beast_transport(transport_config config);

    /// Uses a caller-provided TLS context (certificates, verify mode).
    beast_transport(transport_config config, std::shared_ptr<boost::asio::ssl::context> tls_context);

    beast_transport(const beast_transport&) = delete;
    beast_transport& operator=(const beast_transport&) = delete;
    ~beast_transport() override;

    response perform(const request& req) override;

    [[nodiscard]] const transport_config& config() const { return config_; }
    [[nodiscard]] bool is_connected() const;

    void close();

private:
    using tls_stream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

    void connect();
    bool peer_closed();
    [[nodiscard]] std::string host_field() const;
    boost::beast::tcp_stream& tcp_layer();

    template <typename Stream>
    response exchange(Stream& stream, const request& req);

    transport_config config_;
    boost::asio::io_context io_context_;
    std::shared_ptr<boost::asio::ssl::context> tls_context_;
    std::unique_ptr<boost::beast::tcp_stream> plain_stream_;
    std::unique_ptr<tls_stream> tls_stream_;
    boost::beast::flat_buffer buffer_;
};

} // namespace pushgw::http
