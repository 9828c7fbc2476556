#include "domain/Timeframe.hpp"

#include <cctype>
#include <limits>

#include "domain/Errors.hpp"

namespace domain {

std::int64_t timeframe_seconds(std::string_view label) {
    std::size_t begin = 0;
    std::size_t end = label.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(label[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1])) != 0) {
        --end;
    }
    const auto trimmed = label.substr(begin, end - begin);

    std::size_t digits = 0;
    while (digits < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[digits])) != 0) {
        ++digits;
    }
    if (digits == 0 || digits + 1 != trimmed.size() || digits > 6) {
        throw ConfigurationError("unknown timeframe: '" + std::string{label} + "'");
    }

    std::int64_t count = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        count = count * 10 + (trimmed[i] - '0');
    }
    if (count <= 0) {
        throw ConfigurationError("timeframe must be positive: '" + std::string{label} + "'");
    }

    switch (trimmed.back()) {
    case 's':
        return count;
    case 'm':
        return count * 60;
    case 'h':
        return count * 3'600;
    case 'd':
        return count * 86'400;
    case 'w':
        return count * 604'800;
    default:
        break;
    }
    throw ConfigurationError("unknown timeframe unit: '" + std::string{label} + "'");
}

std::string timeframe_label(std::int64_t intervalSeconds) {
    if (intervalSeconds <= 0) {
        return {};
    }
    if (intervalSeconds % 604'800 == 0) {
        return std::to_string(intervalSeconds / 604'800) + "w";
    }
    if (intervalSeconds % 86'400 == 0) {
        return std::to_string(intervalSeconds / 86'400) + "d";
    }
    if (intervalSeconds % 3'600 == 0) {
        return std::to_string(intervalSeconds / 3'600) + "h";
    }
    if (intervalSeconds % 60 == 0) {
        return std::to_string(intervalSeconds / 60) + "m";
    }
    return std::to_string(intervalSeconds) + "s";
}

}  // namespace domain
