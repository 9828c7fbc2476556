#include "adapters/binance/KlineJson.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <string>

#include <boost/json.hpp>

#include "domain/Errors.hpp"

namespace adapters::binance {
namespace {

using domain::DataIntegrityError;

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        } catch (const std::exception& ex) {
            throw DataIntegrityError("failed to parse integer value '" + str + "': " + ex.what());
        }
    }
    throw DataIntegrityError("unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::exception& ex) {
            throw DataIntegrityError("failed to parse floating value '" + str + "': " + ex.what());
        }
    }
    throw DataIntegrityError("unsupported JSON type for floating conversion");
}

const boost::json::value& require(const boost::json::object& obj, const char* key) {
    const auto* value = obj.if_contains(key);
    if (value == nullptr) {
        throw DataIntegrityError(std::string{"kline missing field '"} + key + "'");
    }
    return *value;
}

boost::json::value parse_json(std::string_view text) {
    boost::json::error_code ec;
    auto json = boost::json::parse(boost::json::string_view{text.data(), text.size()}, ec);
    if (ec) {
        throw DataIntegrityError("invalid JSON payload: " + ec.message());
    }
    return json;
}

}  // namespace

std::string normalize_symbol(std::string_view symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (const unsigned char ch : symbol) {
        if (!std::isspace(ch)) {
            result.push_back(static_cast<char>(std::toupper(ch)));
        }
    }
    return result;
}

std::string kline_stream_name(const std::string& symbol, const std::string& timeframe) {
    std::string lower;
    lower.reserve(symbol.size());
    for (const unsigned char ch : symbol) {
        lower.push_back(static_cast<char>(std::tolower(ch)));
    }
    return lower + "@kline_" + timeframe;
}

domain::Candle candle_from_rest_row(const boost::json::array& row,
                                    const std::string& symbol,
                                    const std::string& timeframe) {
    if (row.size() < 7) {
        throw DataIntegrityError("incomplete kline row (" + std::to_string(row.size()) + " fields)");
    }

    domain::Candle candle{};
    candle.symbol = symbol;
    candle.timeframe = timeframe;
    candle.openTs = json_to_int64(row.at(0)) / 1000;
    candle.open = json_to_double(row.at(1));
    candle.high = json_to_double(row.at(2));
    candle.low = json_to_double(row.at(3));
    candle.close = json_to_double(row.at(4));
    candle.volume = json_to_double(row.at(5));
    candle.closeTs = json_to_int64(row.at(6)) / 1000;
    if (row.size() > 7) {
        candle.quoteVolume = json_to_double(row.at(7));
    }
    if (row.size() > 8) {
        candle.tradeCount = json_to_int64(row.at(8));
    }
    if (row.size() > 9) {
        candle.takerBuyBase = json_to_double(row.at(9));
    }
    if (row.size() > 10) {
        candle.takerBuyQuote = json_to_double(row.at(10));
    }
    return candle;
}

std::vector<domain::Candle> parse_rest_klines(std::string_view body,
                                              const std::string& symbol,
                                              const std::string& timeframe) {
    const auto json = parse_json(body);
    if (!json.is_array()) {
        throw DataIntegrityError("unexpected klines response type (expected array)");
    }

    const auto& outer = json.as_array();
    std::vector<domain::Candle> candles;
    candles.reserve(outer.size());
    for (const auto& rowValue : outer) {
        if (!rowValue.is_array()) {
            throw DataIntegrityError("unexpected kline row type");
        }
        candles.push_back(candle_from_rest_row(rowValue.as_array(), symbol, timeframe));
    }
    return candles;
}

StreamKline parse_stream_kline(std::string_view payload) {
    const auto json = parse_json(payload);
    if (!json.is_object()) {
        throw DataIntegrityError("stream payload is not an object");
    }

    const boost::json::object* event = &json.as_object();
    if (const auto* data = event->if_contains("data")) {
        if (!data->is_object()) {
            throw DataIntegrityError("stream payload 'data' is not an object");
        }
        event = &data->as_object();
    }

    const auto* kValue = event->if_contains("k");
    if (kValue == nullptr || !kValue->is_object()) {
        throw DataIntegrityError("missing kline object");
    }
    const auto& k = kValue->as_object();

    const auto& closedValue = require(k, "x");
    if (!closedValue.is_bool()) {
        throw DataIntegrityError("kline close flag is not a bool");
    }
    const auto& symbolValue = require(k, "s");
    const auto& intervalValue = require(k, "i");
    if (!symbolValue.is_string() || !intervalValue.is_string()) {
        throw DataIntegrityError("kline symbol/interval are not strings");
    }

    StreamKline result{};
    result.closed = closedValue.as_bool();

    auto& candle = result.candle;
    candle.symbol = normalize_symbol(std::string_view{symbolValue.as_string().data(), symbolValue.as_string().size()});
    candle.timeframe = std::string{intervalValue.as_string().c_str()};
    candle.openTs = json_to_int64(require(k, "t")) / 1000;
    candle.closeTs = json_to_int64(require(k, "T")) / 1000;
    candle.open = json_to_double(require(k, "o"));
    candle.high = json_to_double(require(k, "h"));
    candle.low = json_to_double(require(k, "l"));
    candle.close = json_to_double(require(k, "c"));
    candle.volume = json_to_double(require(k, "v"));
    if (const auto* q = k.if_contains("q")) {
        candle.quoteVolume = json_to_double(*q);
    }
    if (const auto* n = k.if_contains("n")) {
        candle.tradeCount = json_to_int64(*n);
    }
    if (const auto* takerBase = k.if_contains("V")) {
        candle.takerBuyBase = json_to_double(*takerBase);
    }
    if (const auto* takerQuote = k.if_contains("Q")) {
        candle.takerBuyQuote = json_to_double(*takerQuote);
    }
    return result;
}

}  // namespace adapters::binance
