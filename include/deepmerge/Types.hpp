/**
 * @file Types.hpp
 * @brief Scalar wrapper types with a fixed wire representation
 *
 * - ByteString: arbitrary bytes, base64 string on the wire
 * - Time: UTC timestamp, RFC 3339 string on the wire
 *
 * Both merge by overwrite (see DeepMerge.hpp).
 */

#ifndef DEEPMERGE_TYPES_HPP
#define DEEPMERGE_TYPES_HPP

#include "deepmerge/Value.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace deepmerge {

/**
 * @brief Owned byte blob
 */
struct ByteString {
    std::vector<std::uint8_t> bytes;

    ByteString() = default;
    explicit ByteString(std::vector<std::uint8_t> b) : bytes(std::move(b)) {}
    explicit ByteString(const std::string& s) : bytes(s.begin(), s.end()) {}

    bool operator==(const ByteString& other) const { return bytes == other.bytes; }
    bool operator!=(const ByteString& other) const { return bytes != other.bytes; }
};

/**
 * @brief Point in time, UTC, second precision
 *
 * Held in whole seconds, so every year from 0001 to 9999 is representable.
 * Finer time points are floored to the second.
 */
struct Time {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

    TimePoint value{};

    Time() = default;

    template <typename Duration>
    explicit Time(std::chrono::time_point<std::chrono::system_clock, Duration> tp)
        : value(std::chrono::floor<std::chrono::seconds>(tp)) {}

    bool operator==(const Time& other) const { return value == other.value; }
    bool operator!=(const Time& other) const { return value != other.value; }
};

/**
 * @brief Encode bytes as standard (padded) base64
 */
std::string base64_encode(const std::vector<std::uint8_t>& bytes);

/**
 * @brief Decode standard base64
 * @throws InvalidValueError on bad characters, bad padding or bad length
 */
std::vector<std::uint8_t> base64_decode(const std::string& text);

/**
 * @brief Format as RFC 3339, e.g. "2018-01-02T03:04:05Z"
 */
std::string format_rfc3339(const Time& t);

/**
 * @brief Parse an RFC 3339 timestamp
 *
 * Accepts "Z" or a numeric "+HH:MM"/"-HH:MM" offset and an optional
 * fractional second, which is dropped.
 *
 * @throws InvalidValueError if the text is not a valid timestamp
 */
Time parse_rfc3339(const std::string& text);

// nlohmann::json ADL hooks
void to_json(Value& j, const ByteString& b);
void from_json(const Value& j, ByteString& b);
void to_json(Value& j, const Time& t);
void from_json(const Value& j, Time& t);

} // namespace deepmerge

#endif // DEEPMERGE_TYPES_HPP
