/**
 * @file Types.cpp
 * @brief Wire codecs for ByteString and Time
 */

#include "deepmerge/Types.hpp"
#include "deepmerge/Errors.hpp"

#include <array>
#include <cctype>
#include <cstdio>

namespace deepmerge {

namespace {

constexpr char kBase64Alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_index(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static constexpr std::array<unsigned, 12> kDays = {
        31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : kDays[m - 1];
}

/**
 * @brief Read exactly `width` decimal digits starting at `pos`
 */
bool read_digits(const std::string& s, size_t pos, size_t width, int& out) {
    if (pos + width > s.size()) return false;
    out = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

bool expect_char(const std::string& s, size_t pos, char c) {
    return pos < s.size() && s[pos] == c;
}

} // anonymous namespace

// ============================================================================
// Base64
// ============================================================================

std::string base64_encode(const std::vector<std::uint8_t>& bytes) {
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        const std::uint32_t n = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                                bytes[i + 2];
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += kBase64Alphabet[n & 0x3F];
    }

    const size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t n = static_cast<std::uint32_t>(bytes[i]) << 16;
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t n = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                                (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out += kBase64Alphabet[(n >> 18) & 0x3F];
        out += kBase64Alphabet[(n >> 12) & 0x3F];
        out += kBase64Alphabet[(n >> 6) & 0x3F];
        out += '=';
    }

    return out;
}

std::vector<std::uint8_t> base64_decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        throw InvalidValueError("ByteString", "base64 length is not a multiple of 4");
    }

    std::vector<std::uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t i = 0; i < text.size(); i += 4) {
        const bool last = i + 4 == text.size();
        int pad = 0;
        std::uint32_t n = 0;

        for (size_t k = 0; k < 4; ++k) {
            const char c = text[i + k];
            if (c == '=') {
                // Padding only in the final quantum, only in the last two slots
                if (!last || k < 2) {
                    throw InvalidValueError("ByteString", "misplaced base64 padding");
                }
                ++pad;
                n <<= 6;
                continue;
            }
            if (pad > 0) {
                throw InvalidValueError("ByteString", "data after base64 padding");
            }
            const int idx = base64_index(c);
            if (idx < 0) {
                throw InvalidValueError("ByteString",
                                        std::string("invalid base64 character '") + c + "'");
            }
            n = (n << 6) | static_cast<std::uint32_t>(idx);
        }

        out.push_back(static_cast<std::uint8_t>((n >> 16) & 0xFF));
        if (pad < 2) out.push_back(static_cast<std::uint8_t>((n >> 8) & 0xFF));
        if (pad < 1) out.push_back(static_cast<std::uint8_t>(n & 0xFF));
    }

    return out;
}

// ============================================================================
// RFC 3339
// ============================================================================

std::string format_rfc3339(const Time& t) {
    const std::int64_t secs = t.value.time_since_epoch().count();

    std::int64_t days = secs / 86400;
    std::int64_t rem = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    std::int64_t year = 0;
    unsigned month = 0;
    unsigned day = 0;
    civil_from_days(days, year, month, day);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<long long>(year), month, day,
                  static_cast<int>(rem / 3600),
                  static_cast<int>((rem % 3600) / 60),
                  static_cast<int>(rem % 60));
    return buf;
}

Time parse_rfc3339(const std::string& text) {
    auto fail = [&](const std::string& why) -> InvalidValueError {
        return InvalidValueError("Time", why + ": '" + text + "'");
    };

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 0, 4, year) || !expect_char(text, 4, '-') ||
        !read_digits(text, 5, 2, month) || !expect_char(text, 7, '-') ||
        !read_digits(text, 8, 2, day)) {
        throw fail("malformed date");
    }
    if (!(expect_char(text, 10, 'T') || expect_char(text, 10, 't'))) {
        throw fail("missing 'T' separator");
    }
    if (!read_digits(text, 11, 2, hour) || !expect_char(text, 13, ':') ||
        !read_digits(text, 14, 2, minute) || !expect_char(text, 16, ':') ||
        !read_digits(text, 17, 2, second)) {
        throw fail("malformed time of day");
    }

    if (month < 1 || month > 12) throw fail("month out of range");
    if (day < 1 || static_cast<unsigned>(day) > days_in_month(year, static_cast<unsigned>(month))) {
        throw fail("day out of range");
    }
    if (hour > 23 || minute > 59 || second > 60) throw fail("time of day out of range");

    size_t pos = 19;
    if (expect_char(text, pos, '.')) {
        ++pos;
        const size_t digits_start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == digits_start) throw fail("empty fractional second");
    }

    std::int64_t offset_seconds = 0;
    if (expect_char(text, pos, 'Z') || expect_char(text, pos, 'z')) {
        ++pos;
    } else if (expect_char(text, pos, '+') || expect_char(text, pos, '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        int oh = 0, om = 0;
        if (!read_digits(text, pos + 1, 2, oh) || !expect_char(text, pos + 3, ':') ||
            !read_digits(text, pos + 4, 2, om) || oh > 23 || om > 59) {
            throw fail("malformed UTC offset");
        }
        offset_seconds = sign * (oh * 3600 + om * 60);
        pos += 6;
    } else {
        throw fail("missing UTC offset");
    }

    if (pos != text.size()) throw fail("trailing characters");

    const std::int64_t days = days_from_civil(year, static_cast<unsigned>(month),
                                              static_cast<unsigned>(day));
    const std::int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;

    // Offsets can push a year-0000 or year-9999 instant outside four-digit years
    const std::int64_t min_secs = days_from_civil(0, 1, 1) * 86400;
    const std::int64_t max_secs = days_from_civil(9999, 12, 31) * 86400 + 86399;
    if (secs < min_secs || secs > max_secs) throw fail("out of range");

    return Time(Time::TimePoint(std::chrono::seconds(secs)));
}

// ============================================================================
// JSON hooks
// ============================================================================

void to_json(Value& j, const ByteString& b) {
    j = base64_encode(b.bytes);
}

void from_json(const Value& j, ByteString& b) {
    if (!j.is_string()) {
        throw InvalidValueError("ByteString", "expected string, got " + type_name(j));
    }
    b.bytes = base64_decode(j.get<std::string>());
}

void to_json(Value& j, const Time& t) {
    j = format_rfc3339(t);
}

void from_json(const Value& j, Time& t) {
    if (!j.is_string()) {
        throw InvalidValueError("Time", "expected string, got " + type_name(j));
    }
    t = parse_rfc3339(j.get<std::string>());
}

} // namespace deepmerge
