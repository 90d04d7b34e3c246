#include <pushgw/http/beast_transport.hpp>
#include <pushgw/logger.h>
#include <pushgw/version.hpp>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <stdexcept>

namespace pushgw::http
{

    namespace asio  = boost::asio;
    namespace beast = boost::beast;
    namespace bhttp = boost::beast::http;
    using boost::system::error_code;

    namespace
    {
        void run_pending(asio::io_context& io_context)
        {
            io_context.restart();
            io_context.run();
        }

        void throw_on_error(const error_code& ec, const char* what)
        {
            if (ec)
                throw boost::system::system_error(ec, what);
        }

        std::string to_std_string(beast::string_view value)
        {
            return std::string(value.data(), value.size());
        }

        std::shared_ptr<asio::ssl::context> make_default_tls_context()
        {
            auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
            ctx->set_default_verify_paths();
            ctx->set_verify_mode(asio::ssl::verify_peer);
            return ctx;
        }
    } // namespace

    beast_transport::beast_transport(transport_config config)
      : beast_transport(std::move(config), nullptr)
    {
    }

    beast_transport::beast_transport(
      transport_config config,
      std::shared_ptr<asio::ssl::context> tls_context
    )
      : config_ {std::move(config)}
      , tls_context_ {std::move(tls_context)}
    {
        if (!config_.is_valid())
        {
            throw std::invalid_argument("Invalid transport configuration");
        }
        if (config_.use_tls && !tls_context_)
        {
            tls_context_ = make_default_tls_context();
        }
    }

    beast_transport::~beast_transport()
    {
        close();
    }

    bool beast_transport::is_connected() const
    {
        return plain_stream_ != nullptr || tls_stream_ != nullptr;
    }

    beast::tcp_stream& beast_transport::tcp_layer()
    {
        if (tls_stream_)
            return tls_stream_->next_layer();
        return *plain_stream_;
    }

    void beast_transport::close()
    {
        if (!is_connected())
            return;

        error_code ec;
        auto& socket = tcp_layer().socket();
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);

        tls_stream_.reset();
        plain_stream_.reset();
        buffer_.consume(buffer_.size());

        PUSHGW_LOG_DEBUG("closed connection to {}:{}", config_.host, config_.port);
    }

    std::string beast_transport::host_field() const
    {
        std::string host = config_.host.find(':') != std::string::npos
                             ? "[" + config_.host + "]"
                             : config_.host;
        if (config_.port != (config_.use_tls ? 443 : 80))
            host += ":" + std::to_string(config_.port);
        return host;
    }

    bool beast_transport::peer_closed()
    {
        auto& socket = tcp_layer().socket();

        error_code ec;
        socket.non_blocking(true, ec);
        if (ec)
            return true;

        // An idle keep-alive connection has nothing to read; EOF or any
        // unsolicited bytes mean the server is done with it.
        char peeked = 0;
        socket.receive(asio::buffer(&peeked, 1), asio::socket_base::message_peek, ec);
        bool closed = ec != asio::error::would_block;

        error_code ignored;
        socket.non_blocking(false, ignored);
        return closed;
    }

    void beast_transport::connect()
    {
        error_code ec;

        asio::ip::tcp::resolver resolver {io_context_};
        asio::ip::tcp::resolver::results_type endpoints;
        asio::steady_timer deadline {io_context_};
        bool timed_out = false;

        deadline.expires_after(config_.open_timeout);
        deadline.async_wait([&](error_code timer_ec) {
            if (!timer_ec)
            {
                timed_out = true;
                resolver.cancel();
            }
        });
        resolver.async_resolve(
          config_.host,
          std::to_string(config_.port),
          [&](error_code resolve_ec, asio::ip::tcp::resolver::results_type results) {
              ec        = resolve_ec;
              endpoints = std::move(results);
              deadline.cancel();
          }
        );
        run_pending(io_context_);
        if (timed_out)
            ec = beast::error::timeout;
        throw_on_error(ec, "resolve");

        if (config_.use_tls)
            tls_stream_ = std::make_unique<tls_stream>(io_context_, *tls_context_);
        else
            plain_stream_ = std::make_unique<beast::tcp_stream>(io_context_);

        auto& tcp = tcp_layer();
        tcp.expires_after(config_.open_timeout);
        tcp.async_connect(endpoints, [&](error_code connect_ec, const asio::ip::tcp::endpoint&) {
            ec = connect_ec;
        });
        run_pending(io_context_);
        throw_on_error(ec, "connect");

        if (tls_stream_)
        {
            // SNI carries host names only, never address literals.
            error_code not_an_address;
            asio::ip::make_address(config_.host, not_an_address);
            if (not_an_address &&
                !SSL_set_tlsext_host_name(tls_stream_->native_handle(), config_.host.c_str()))
            {
                throw boost::system::system_error(
                  error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()),
                  "set SNI host name"
                );
            }
            tls_stream_->set_verify_callback(asio::ssl::host_name_verification(config_.host));

            tcp.expires_after(config_.open_timeout);
            tls_stream_->async_handshake(asio::ssl::stream_base::client, [&](error_code handshake_ec) {
                ec = handshake_ec;
            });
            run_pending(io_context_);
            throw_on_error(ec, "handshake");
        }

        tcp.expires_never();
        PUSHGW_LOG_INFO(
          "connected to {}:{}{}", config_.host, config_.port, config_.use_tls ? " (tls)" : ""
        );
    }

    template <typename Stream>
    response beast_transport::exchange(Stream& stream, const request& req)
    {
        bhttp::request<bhttp::string_body> msg {req.method, req.target, 11};
        msg.set(bhttp::field::host, host_field());
        msg.set(bhttp::field::user_agent, std::string {user_agent()});
        for (const auto& [name, value]: req.headers)
        {
            msg.set(name, value);
        }
        if (req.body)
        {
            msg.body() = *req.body;
        }
        msg.keep_alive(true);
        msg.prepare_payload();

        error_code ec;
        auto& tcp = tcp_layer();

        tcp.expires_after(config_.read_timeout);
        bhttp::async_write(stream, msg, [&](error_code write_ec, std::size_t) {
            ec = write_ec;
        });
        run_pending(io_context_);
        throw_on_error(ec, "write");

        bhttp::response<bhttp::string_body> res;
        tcp.expires_after(config_.read_timeout);
        bhttp::async_read(stream, buffer_, res, [&](error_code read_ec, std::size_t) {
            ec = read_ec;
        });
        run_pending(io_context_);
        throw_on_error(ec, "read");
        tcp.expires_never();

        PUSHGW_LOG_DEBUG(
          "{} {} -> {}", to_std_string(bhttp::to_string(req.method)), req.target, res.result_int()
        );

        response out;
        out.status = res.result_int();
        out.reason = to_std_string(res.reason());
        out.body   = std::move(res.body());
        for (const auto& field: res)
        {
            auto& value = out.headers[to_std_string(field.name_string())];
            if (!value.empty())
                value += ", ";
            value += to_std_string(field.value());
        }

        if (!res.keep_alive())
            close();

        return out;
    }

    response beast_transport::perform(const request& req)
    {
        if (is_connected() && peer_closed())
        {
            PUSHGW_LOG_WARNING(
              "connection to {}:{} was closed by the server while idle, reopening", config_.host, config_.port
            );
            close();
        }

        try
        {
            if (!is_connected())
                connect();

            if (tls_stream_)
                return exchange(*tls_stream_, req);
            return exchange(*plain_stream_, req);
        }
        catch (const boost::system::system_error& e)
        {
            PUSHGW_LOG_ERROR(
              "{} {} on {}:{} failed: {}",
              to_std_string(bhttp::to_string(req.method)), req.target, config_.host, config_.port, e.what()
            );
            close();
            throw;
        }
    }

} // namespace pushgw::http
