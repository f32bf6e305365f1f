/*
MarketStream — BeastWsTransport
Role: TLS WebSocket implementation of WsTransport on Boost.Beast.
Inputs/Outputs: host/port/target in; open/message/error/close callbacks out, one CloseInfo per socket.
Threading: All handlers run on a per-transport strand of the shared io_context.
Performance: Outbound frames are queued and written one at a time; reads reuse one flat_buffer.
Integration: ConnectionHub creates one instance per connection attempt through factory().
Observability: Failures are logged under "transport" without the request target (it carries the token).
Related: WsTransport.hpp, ManagedConnection.hpp.
Assumptions: io_context and ssl::context outlive every transport created from them.
*/
#pragma once
#include "WsTransport.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <deque>
#include <memory>
#include <string>

namespace MarketStream {

// Handlers keep the transport alive through shared_from_this, so the owner
// may drop its pointer while operations are still in flight.
class BeastWsTransport : public WsTransport, public std::enable_shared_from_this<BeastWsTransport> {
public:
    using IoContext = boost::asio::io_context;
    using SslContext = boost::asio::ssl::context;

    // Resolve + TCP connect + TLS handshake must finish within this window
    static constexpr std::chrono::seconds kConnectTimeout{30};

    BeastWsTransport(IoContext& ioc, SslContext& sslCtx);

    void connect(std::string host, std::string port, std::string target) override;
    void close() override;
    void send(std::string msg) override;

    void onMessage(MessageCb cb) override { m_onMessage = std::move(cb); }
    void onOpen(OpenCb cb) override { m_onOpen = std::move(cb); }
    void onClose(CloseCb cb) override { m_onClose = std::move(cb); }
    void onError(ErrorCb cb) override { m_onError = std::move(cb); }

    static TransportFactory factory(IoContext& ioc, SslContext& sslCtx);

private:
    using ErrorCode = boost::beast::error_code;
    using Resolver = boost::asio::ip::tcp::resolver;
    using Stream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    void onResolve(ErrorCode ec, Resolver::results_type results);
    void onConnect(ErrorCode ec);
    void onTlsHandshake(ErrorCode ec);
    void onWsHandshake(ErrorCode ec);
    void doRead();
    void onRead(ErrorCode ec);
    void doWrite();

    void fail(const char* stage, ErrorCode ec);
    void emitClose(CloseInfo info);

    MessageCb m_onMessage;
    OpenCb    m_onOpen;
    CloseCb   m_onClose;
    ErrorCb   m_onError;

    boost::asio::strand<IoContext::executor_type> m_strand;
    Resolver m_resolver;
    Stream m_ws;
    boost::beast::flat_buffer m_buffer;
    std::deque<std::string> m_writeQueue;

    std::string m_host;
    std::string m_port;
    std::string m_target;
    bool m_open{false};
    bool m_closed{false};
};

} // namespace MarketStream
