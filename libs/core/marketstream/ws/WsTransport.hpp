#pragma once
#include <functional>
#include <memory>
#include <string>

namespace MarketStream {

// Close frame details as seen by the client. 1006 is used for abnormal closure
// (no close frame: resolve/connect/handshake failures, read errors).
struct CloseInfo {
    int code{1006};
    std::string reason;
};

// Byte-level socket seam. Knows nothing about topics, tokens or frames' meaning;
// tests substitute fixtures::MockTransport.
class WsTransport {
public:
    using MessageCb = std::function<void(std::string)>; // payload is moved in, callee owns it
    using OpenCb    = std::function<void()>;
    using CloseCb   = std::function<void(CloseInfo)>;
    using ErrorCb   = std::function<void(std::string)>;

    virtual ~WsTransport() = default;

    // target is the request path including any query string
    virtual void connect(std::string host, std::string port, std::string target) = 0;
    virtual void close() = 0;
    virtual void send(std::string msg) = 0; // dropped unless open; writes never interleave

    virtual void onMessage(MessageCb) = 0;
    virtual void onOpen(OpenCb) = 0;
    virtual void onClose(CloseCb) = 0;
    virtual void onError(ErrorCb) = 0;
};

// The hub creates one transport per physical connection attempt.
using TransportFactory = std::function<std::shared_ptr<WsTransport>()>;

} // namespace MarketStream
