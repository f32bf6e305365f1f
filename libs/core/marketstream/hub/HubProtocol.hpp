#pragma once
#include "../ws/WsTransport.hpp"
#include <string>
#include <string_view>

namespace MarketStream {
namespace HubProtocol {

// Close codes after which reconnecting with the same credentials is pointless
inline constexpr int kPolicyViolation = 1008;
inline constexpr int kUnauthorized = 4401;
inline constexpr int kForbidden = 4403;

inline constexpr std::string_view kPingFrame = R"({"action":"ping"})";

// 1008/4401/4403, or a reason mentioning "token expired", "token invalid" or
// "authentication failed" in any case.
bool isAuthenticationFailure(const CloseInfo& info);

// encodeURIComponent-compatible
std::string percentEncode(std::string_view value);

// "<path>?token=<encoded>" (or "&token=" when the path already has a query)
std::string buildTarget(std::string_view path, std::string_view token);

// Replaces every token query value with REDACTED. Anything logged goes through here.
std::string redactToken(std::string_view url);

} // namespace HubProtocol
} // namespace MarketStream
