#pragma once

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/numeric/conversion/cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace confwire::binding {

class CoercionRegistry;

namespace coercions {

// "true" / "false", any case, surrounding whitespace ignored
bool parse_boolean(const std::string& raw);

// Exactly one character
char parse_char(const std::string& raw);

/**
 * @brief Decimal integer with an optional sign, range-checked for T
 */
template <typename T>
T parse_integral(const std::string& raw) {
    static_assert(std::is_integral_v<T>, "T must be an integral type");
    const std::string text = boost::algorithm::trim_copy(raw);
    if constexpr (std::is_signed_v<T>) {
        return boost::numeric_cast<T>(boost::lexical_cast<long long>(text));
    } else {
        // lexical_cast wraps negative input for unsigned targets
        if (!text.empty() && text.front() == '-') {
            throw std::out_of_range("negative value for unsigned type");
        }
        return boost::numeric_cast<T>(
            boost::lexical_cast<unsigned long long>(text));
    }
}

template <typename T>
T parse_floating(const std::string& raw) {
    static_assert(std::is_floating_point_v<T>,
                  "T must be a floating point type");
    return boost::lexical_cast<T>(boost::algorithm::trim_copy(raw));
}

/**
 * @brief Time-span literal: [-]d | [-][d.]hh:mm[:ss[.fffffff]]
 *
 * Hours are 0-23, minutes and seconds 0-59, at most seven fraction
 * digits. A bare integer is a number of days.
 */
std::chrono::nanoseconds parse_time_span(const std::string& raw);

/**
 * @brief Time-span literal in a coarser unit
 * @throws std::invalid_argument if the value is not a whole number of
 * Duration ticks ("00:00:30.9" for std::chrono::seconds)
 */
template <typename Duration>
Duration parse_duration(const std::string& raw) {
    const std::chrono::nanoseconds value = parse_time_span(raw);
    const auto result = std::chrono::duration_cast<Duration>(value);
    if (result != value) {
        throw std::invalid_argument("time span '" + raw +
                                    "' is finer than the target unit");
    }
    return result;
}

// 8-4-4-4-12 hex digits, optionally braced, hyphens optional
boost::uuids::uuid parse_uuid(const std::string& raw);

void register_builtin_coercions(CoercionRegistry& registry);

}  // namespace coercions
}  // namespace confwire::binding
