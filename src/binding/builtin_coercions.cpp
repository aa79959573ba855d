#include "confwire/binding/builtin_coercions.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/uuid/string_generator.hpp>
#include <cstdint>
#include <vector>

#include "confwire/binding/coercion_registry.hpp"
#include "confwire/binding/uri_coercion.hpp"

namespace confwire::binding::coercions {

namespace {

constexpr long long kMaxDays = 106751;  // nanoseconds range of int64
constexpr std::size_t kMaxFractionDigits = 7;

long long parse_component(const std::string& text, const char* what,
                          long long max_value) {
    if (text.empty() || !boost::algorithm::all(text, boost::is_digit())) {
        throw std::invalid_argument(std::string("invalid ") + what +
                                    " component '" + text + "'");
    }
    const auto value = boost::lexical_cast<long long>(text);
    if (value > max_value) {
        throw std::out_of_range(std::string(what) + " out of range: " + text);
    }
    return value;
}

std::chrono::nanoseconds parse_fraction(const std::string& digits) {
    if (digits.empty() || digits.size() > kMaxFractionDigits ||
        !boost::algorithm::all(digits, boost::is_digit())) {
        throw std::invalid_argument("invalid fraction '" + digits + "'");
    }
    std::string padded = digits;
    padded.append(9 - digits.size(), '0');
    return std::chrono::nanoseconds(boost::lexical_cast<long long>(padded));
}

// The day count alone fits, but days plus a time of day can pass the
// nanosecond range.
void add_checked(std::chrono::nanoseconds& total,
                 std::chrono::nanoseconds part) {
    if (total > std::chrono::nanoseconds::max() - part) {
        throw std::out_of_range("time span exceeds the nanosecond range");
    }
    total += part;
}

}  // namespace

bool parse_boolean(const std::string& raw) {
    const std::string text = boost::algorithm::trim_copy(raw);
    if (boost::algorithm::iequals(text, "true")) {
        return true;
    }
    if (boost::algorithm::iequals(text, "false")) {
        return false;
    }
    throw std::invalid_argument("expected 'true' or 'false'");
}

char parse_char(const std::string& raw) {
    if (raw.size() != 1) {
        throw std::invalid_argument("expected exactly one character");
    }
    return raw.front();
}

std::chrono::nanoseconds parse_time_span(const std::string& raw) {
    using namespace std::chrono;

    std::string text = boost::algorithm::trim_copy(raw);
    const bool negative = !text.empty() && text.front() == '-';
    if (negative) {
        text.erase(0, 1);
    }
    if (text.empty()) {
        throw std::invalid_argument("empty time span");
    }

    const auto colon = text.find(':');
    if (colon == std::string::npos) {
        const auto days = hours(24 * parse_component(text, "days", kMaxDays));
        return negative ? -duration_cast<nanoseconds>(days)
                        : duration_cast<nanoseconds>(days);
    }

    nanoseconds total{0};
    std::string time_part = text;
    const auto dot = text.find('.');
    if (dot != std::string::npos && dot < colon) {
        add_checked(total, hours(24 * parse_component(text.substr(0, dot),
                                                      "days", kMaxDays)));
        time_part = text.substr(dot + 1);
    }

    std::vector<std::string> fields;
    boost::algorithm::split(fields, time_part, boost::is_any_of(":"));
    if (fields.size() < 2 || fields.size() > 3) {
        throw std::invalid_argument("expected hh:mm or hh:mm:ss");
    }

    add_checked(total, hours(parse_component(fields[0], "hours", 23)));
    add_checked(total, minutes(parse_component(fields[1], "minutes", 59)));

    if (fields.size() == 3) {
        std::string seconds_part = fields[2];
        const auto fraction_dot = seconds_part.find('.');
        if (fraction_dot != std::string::npos) {
            add_checked(total,
                        parse_fraction(seconds_part.substr(fraction_dot + 1)));
            seconds_part.erase(fraction_dot);
        }
        add_checked(total,
                    seconds(parse_component(seconds_part, "seconds", 59)));
    }

    return negative ? -total : total;
}

boost::uuids::uuid parse_uuid(const std::string& raw) {
    return boost::uuids::string_generator()(boost::algorithm::trim_copy(raw));
}

void register_builtin_coercions(CoercionRegistry& registry) {
    registry.add<std::string>([](const std::string& raw) { return raw; });
    registry.add<bool>(&parse_boolean);
    registry.add<char>(&parse_char);

    registry.add<signed char>(&parse_integral<signed char>);
    registry.add<unsigned char>(&parse_integral<unsigned char>);
    registry.add<short>(&parse_integral<short>);
    registry.add<unsigned short>(&parse_integral<unsigned short>);
    registry.add<int>(&parse_integral<int>);
    registry.add<unsigned int>(&parse_integral<unsigned int>);
    registry.add<long>(&parse_integral<long>);
    registry.add<unsigned long>(&parse_integral<unsigned long>);
    registry.add<long long>(&parse_integral<long long>);
    registry.add<unsigned long long>(&parse_integral<unsigned long long>);

    registry.add<float>(&parse_floating<float>);
    registry.add<double>(&parse_floating<double>);
    registry.add<long double>(&parse_floating<long double>);

    registry.add<std::chrono::nanoseconds>(&parse_time_span);
    registry.add<std::chrono::microseconds>(
        &parse_duration<std::chrono::microseconds>);
    registry.add<std::chrono::milliseconds>(
        &parse_duration<std::chrono::milliseconds>);
    registry.add<std::chrono::seconds>(&parse_duration<std::chrono::seconds>);
    registry.add<std::chrono::minutes>(&parse_duration<std::chrono::minutes>);
    registry.add<std::chrono::hours>(&parse_duration<std::chrono::hours>);

    registry.add<boost::uuids::uuid>(&parse_uuid);
    registry.add<boost::urls::url>(&parse_uri);
}

}  // namespace confwire::binding::coercions
