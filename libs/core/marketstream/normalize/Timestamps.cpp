#include "Timestamps.hpp"
#include "JsonFields.hpp"
#include <fmt/format.h>
#include <cctype>

namespace MarketStream {
namespace Timestamps {

namespace {

// Collapses whitespace, unifies date separators and glues a trailing zone to the time.
std::string sanitize(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    bool pendingSpace = false;
    for (char c : JsonFields::trim(raw)) {
        if (std::isspace(static_cast<unsigned char>(c))) { pendingSpace = true; continue; }
        if (pendingSpace) {
            const bool zoneFollows = c == 'Z' || c == 'z' || c == '+';
            if (!zoneFollows) out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(c == '/' ? '-' : c);
    }
    return out;
}

class Cursor {
public:
    explicit Cursor(std::string_view s) : m_s(s) {}

    bool done() const { return m_pos >= m_s.size(); }
    char peek() const { return done() ? '\0' : m_s[m_pos]; }
    void skip() { ++m_pos; }

    bool consume(char c) {
        if (peek() != c) return false;
        ++m_pos;
        return true;
    }

    // Reads between minDigits and maxDigits decimal digits.
    std::optional<int> digits(std::size_t minDigits, std::size_t maxDigits) {
        int value = 0;
        std::size_t n = 0;
        while (n < maxDigits && !done() && std::isdigit(static_cast<unsigned char>(peek()))) {
            value = value * 10 + (peek() - '0');
            ++m_pos;
            ++n;
        }
        if (n < minDigits) return std::nullopt;
        return value;
    }

private:
    std::string_view m_s;
    std::size_t m_pos{0};
};

} // namespace

std::optional<UtcMillis> parseUtc(std::string_view text) {
    using namespace std::chrono;

    const std::string cleaned = sanitize(text);
    if (cleaned.empty()) return std::nullopt;
    Cursor cur(cleaned);

    const auto yearValue = cur.digits(4, 4);
    if (!yearValue || !cur.consume('-')) return std::nullopt;
    const auto monthValue = cur.digits(1, 2);
    if (!monthValue || !cur.consume('-')) return std::nullopt;
    const auto dayValue = cur.digits(1, 2);
    if (!dayValue) return std::nullopt;

    const year_month_day ymd{year{*yearValue}, month{static_cast<unsigned>(*monthValue)},
                             day{static_cast<unsigned>(*dayValue)}};
    if (!ymd.ok()) return std::nullopt;

    int hourValue = 0, minuteValue = 0, secondValue = 0, millis = 0;
    const bool hasTime = !cur.done();
    if (hasTime) {
        const char sep = cur.peek();
        if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
        cur.skip();

        const auto h = cur.digits(1, 2);
        if (!h || !cur.consume(':')) return std::nullopt;
        const auto m = cur.digits(2, 2);
        if (!m) return std::nullopt;
        hourValue = *h;
        minuteValue = *m;

        if (cur.consume(':')) {
            const auto s = cur.digits(2, 2);
            if (!s) return std::nullopt;
            secondValue = *s;
            if (cur.consume('.') || cur.consume(',')) {
                int scale = 100;
                std::size_t count = 0;
                while (!cur.done() && std::isdigit(static_cast<unsigned char>(cur.peek()))) {
                    if (count < 3) millis += (cur.peek() - '0') * scale;
                    scale /= 10;
                    ++count;
                    cur.skip();
                }
                if (count == 0) return std::nullopt;
            }
        }
    }
    if (hourValue > 23 || minuteValue > 59 || secondValue > 59) return std::nullopt;

    int offsetMinutes = 0;
    if (hasTime) cur.consume(' ');
    if (!cur.done()) {
        const char zone = cur.peek();
        if (zone == 'Z' || zone == 'z') {
            cur.skip();
        } else if (zone == '+' || zone == '-') {
            cur.skip();
            const auto oh = cur.digits(2, 2);
            if (!oh) return std::nullopt;
            cur.consume(':');
            const auto om = cur.digits(2, 2);
            if (!om || *oh > 23 || *om > 59) return std::nullopt;
            offsetMinutes = (*oh * 60 + *om) * (zone == '+' ? 1 : -1);
        } else {
            return std::nullopt;
        }
    }
    if (!cur.done()) return std::nullopt;

    UtcMillis tp = time_point_cast<milliseconds>(sys_days{ymd});
    tp += hours(hourValue) + minutes(minuteValue) + seconds(secondValue) + milliseconds(millis);
    tp -= minutes(offsetMinutes);
    return tp;
}

std::string formatUtc(UtcMillis tp) {
    using namespace std::chrono;
    const auto dayPoint = floor<days>(tp);
    const year_month_day ymd{dayPoint};
    const hh_mm_ss<milliseconds> tod{tp - dayPoint};
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()),
                       tod.hours().count(),
                       tod.minutes().count(),
                       tod.seconds().count(),
                       tod.subseconds().count());
}

std::optional<std::string> normalizeToUtc(std::string_view text) {
    if (auto tp = parseUtc(text)) return formatUtc(*tp);
    return std::nullopt;
}

std::string nowUtc() {
    return formatUtc(std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()));
}

} // namespace Timestamps
} // namespace MarketStream
