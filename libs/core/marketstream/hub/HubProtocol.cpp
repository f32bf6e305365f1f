#include "HubProtocol.hpp"
#include "../normalize/JsonFields.hpp"
#include <array>
#include <cctype>

namespace MarketStream {
namespace HubProtocol {

bool isAuthenticationFailure(const CloseInfo& info) {
    if (info.code == kPolicyViolation || info.code == kUnauthorized || info.code == kForbidden) {
        return true;
    }
    if (info.reason.empty()) return false;
    const auto reason = JsonFields::toLower(info.reason);
    constexpr std::array<std::string_view, 3> kMarkers = {
        "token expired", "token invalid", "authentication failed"};
    for (auto marker : kMarkers) {
        if (reason.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::string percentEncode(std::string_view value) {
    constexpr std::string_view kUnreserved = "-_.!~*'()";
    constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || kUnreserved.find(static_cast<char>(c)) != std::string_view::npos) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string buildTarget(std::string_view path, std::string_view token) {
    std::string target(path.empty() ? std::string_view("/") : path);
    target.push_back(target.find('?') == std::string::npos ? '?' : '&');
    target.append("token=");
    target.append(percentEncode(token));
    return target;
}

std::string redactToken(std::string_view url) {
    const std::string lower = JsonFields::toLower(url);
    std::string out;
    out.reserve(url.size());
    std::size_t pos = 0;
    while (pos < url.size()) {
        const auto hit = lower.find("token=", pos);
        if (hit == std::string::npos) break;
        const bool atBoundary = hit == 0 || lower[hit - 1] == '?' || lower[hit - 1] == '&' || lower[hit - 1] == '#';
        const auto valueStart = hit + 6;
        out.append(url.substr(pos, valueStart - pos));
        if (!atBoundary) {
            pos = valueStart;
            continue;
        }
        auto valueEnd = url.find_first_of("&#", valueStart);
        if (valueEnd == std::string_view::npos) valueEnd = url.size();
        out.append("REDACTED");
        pos = valueEnd;
    }
    out.append(url.substr(pos));
    return out;
}

} // namespace HubProtocol
} // namespace MarketStream
