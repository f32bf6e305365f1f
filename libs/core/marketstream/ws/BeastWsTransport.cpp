#include "BeastWsTransport.hpp"
#include "../Log.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

namespace MarketStream {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;

namespace {

constexpr int kAbnormalClosure = 1006;
constexpr int kNormalClosure = 1000;
constexpr const char* kUserAgent = "marketstream-client";

} // namespace

BeastWsTransport::BeastWsTransport(IoContext& ioc, SslContext& sslCtx)
    : m_strand(net::make_strand(ioc))
    , m_resolver(m_strand)
    , m_ws(m_strand, sslCtx)
{
}

TransportFactory BeastWsTransport::factory(IoContext& ioc, SslContext& sslCtx) {
    return [&ioc, &sslCtx]() -> std::shared_ptr<WsTransport> {
        return std::make_shared<BeastWsTransport>(ioc, sslCtx);
    };
}

void BeastWsTransport::connect(std::string host, std::string port, std::string target) {
    m_host = std::move(host);
    m_port = std::move(port);
    m_target = std::move(target);
    LOG_D("transport", "resolving {}:{}", m_host, m_port);

    m_resolver.async_resolve(m_host, m_port,
        [self = shared_from_this()](ErrorCode ec, Resolver::results_type results) {
            self->onResolve(ec, std::move(results));
        });
}

void BeastWsTransport::close() {
    net::post(m_strand, [self = shared_from_this()] {
        if (self->m_closed) return;
        if (self->m_open) {
            self->m_ws.async_close(websocket::close_code::normal, [self](ErrorCode ec) {
                if (ec) LOG_D("transport", "close handshake with {} ended: {}", self->m_host, ec.message());
                self->emitClose(CloseInfo{kNormalClosure, "client closed"});
            });
            return;
        }
        // Still resolving, connecting or handshaking: abort the pending step
        self->m_resolver.cancel();
        beast::get_lowest_layer(self->m_ws).cancel();
        self->emitClose(CloseInfo{kNormalClosure, "client closed"});
    });
}

void BeastWsTransport::send(std::string msg) {
    net::post(m_strand, [self = shared_from_this(), m = std::move(msg)]() mutable {
        if (!self->m_open) return;
        self->m_writeQueue.push_back(std::move(m));
        if (self->m_writeQueue.size() == 1) self->doWrite();
    });
}

void BeastWsTransport::onResolve(ErrorCode ec, Resolver::results_type results) {
    if (ec) return fail("resolve", ec);
    beast::get_lowest_layer(m_ws).expires_after(kConnectTimeout);
    beast::get_lowest_layer(m_ws).async_connect(results,
        [self = shared_from_this()](ErrorCode ec, const Resolver::results_type::endpoint_type&) {
            self->onConnect(ec);
        });
}

void BeastWsTransport::onConnect(ErrorCode ec) {
    if (ec) return fail("connect", ec);

    auto* handle = m_ws.next_layer().native_handle();
    if (!SSL_set_tlsext_host_name(handle, m_host.c_str()) || !SSL_set1_host(handle, m_host.c_str())) {
        ErrorCode sslEc(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail("sni", sslEc);
    }
    m_ws.next_layer().set_verify_mode(ssl::verify_peer);
    m_ws.next_layer().async_handshake(ssl::stream_base::client,
        [self = shared_from_this()](ErrorCode ec) { self->onTlsHandshake(ec); });
}

void BeastWsTransport::onTlsHandshake(ErrorCode ec) {
    if (ec) return fail("tls-handshake", ec);

    // The websocket layer runs its own idle/handshake timeouts from here on
    beast::get_lowest_layer(m_ws).expires_never();
    m_ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    m_ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, kUserAgent);
    }));
    m_ws.async_handshake(m_host, m_target,
        [self = shared_from_this()](ErrorCode ec) { self->onWsHandshake(ec); });
}

void BeastWsTransport::onWsHandshake(ErrorCode ec) {
    if (ec) return fail("ws-handshake", ec);
    if (m_closed) return;
    m_open = true;
    LOG_D("transport", "websocket open to {}:{}", m_host, m_port);
    if (m_onOpen) m_onOpen();
    doRead();
}

void BeastWsTransport::doRead() {
    m_ws.async_read(m_buffer, [self = shared_from_this()](ErrorCode ec, std::size_t) {
        self->onRead(ec);
    });
}

void BeastWsTransport::onRead(ErrorCode ec) {
    if (ec == websocket::error::closed) {
        const auto& reason = m_ws.reason();
        LOG_D("transport", "close frame from {} code={}", m_host, static_cast<int>(reason.code));
        emitClose(CloseInfo{static_cast<int>(reason.code), std::string(reason.reason.c_str())});
        return;
    }
    if (ec) return fail("read", ec);

    auto payload = beast::buffers_to_string(m_buffer.data());
    m_buffer.consume(m_buffer.size());
    if (m_onMessage) m_onMessage(std::move(payload));

    if (!m_closed) doRead();
}

void BeastWsTransport::doWrite() {
    if (m_writeQueue.empty()) return;
    m_ws.async_write(net::buffer(m_writeQueue.front()), [self = shared_from_this()](ErrorCode ec, std::size_t) {
        if (ec) return self->fail("write", ec);
        self->m_writeQueue.pop_front();
        if (!self->m_writeQueue.empty()) self->doWrite();
    });
}

void BeastWsTransport::fail(const char* stage, ErrorCode ec) {
    if (m_closed) return;
    LOG_W("transport", "{} failed for {}:{}: {}", stage, m_host, m_port, ec.message());
    if (m_onError) m_onError(std::string(stage) + ": " + ec.message());
    emitClose(CloseInfo{kAbnormalClosure, ec.message()});
}

void BeastWsTransport::emitClose(CloseInfo info) {
    if (m_closed) return;
    m_closed = true;
    m_open = false;
    m_writeQueue.clear();
    if (m_onClose) m_onClose(std::move(info));
}

} // namespace MarketStream
