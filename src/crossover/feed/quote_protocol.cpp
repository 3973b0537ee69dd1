#include <crossover/feed/quote_protocol.hpp>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace crossover::feed::quote_protocol {

namespace {

// Position just past `"key":`, or npos.
size_t value_offset(const std::string& json, const std::string& key) {
    std::string quoted = "\"" + key + "\"";
    auto p = json.find(quoted);
    if (p == std::string::npos) {
        return std::string::npos;
    }
    p = json.find_first_not_of(" \t\r\n", p + quoted.size());
    if (p == std::string::npos || json[p] != ':') {
        return std::string::npos;
    }
    return json.find_first_not_of(" \t\r\n", p + 1);
}

std::string escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace

std::string encode_request(const core::Instrument& instrument, core::Resolution resolution) {
    std::ostringstream out;
    out << "{\"Symbol\":\"" << escape(instrument.symbol)
        << "\",\"Exchange\":\"" << escape(instrument.exchange)
        << "\",\"Screener\":\"" << escape(instrument.screener)
        << "\",\"Interval\":\"" << to_string(resolution) << "\"}";
    return out.str();
}

std::optional<std::string> string_field(const std::string& json, const std::string& key) {
    auto p = value_offset(json, key);
    if (p == std::string::npos || json[p] != '"') {
        return std::nullopt;
    }

    std::string value;
    for (size_t i = p + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '\\' && i + 1 < json.size()) {
            value.push_back(json[++i]);
        } else if (c == '"') {
            return value;
        } else {
            value.push_back(c);
        }
    }
    return std::nullopt;
}

std::optional<double> number_field(const std::string& json, const std::string& key) {
    auto p = value_offset(json, key);
    if (p == std::string::npos) {
        return std::nullopt;
    }

    auto end = json.find_first_not_of("0123456789.eE+-", p);
    std::string token = json.substr(p, end == std::string::npos ? std::string::npos : end - p);
    if (token.empty()) {
        return std::nullopt;
    }

    char* parsed_end = nullptr;
    double value = std::strtod(token.c_str(), &parsed_end);
    if (parsed_end != token.c_str() + token.size()) {
        return std::nullopt;
    }
    return value;
}

FetchResult decode_reply(const std::string& reply) {
    auto status = number_field(reply, "Status");
    if (!status || !(*status >= 100.0 && *status <= 999.0) || std::trunc(*status) != *status) {
        return FetchResult::unavailable("malformed reply: " + reply);
    }

    int code = static_cast<int>(*status);
    if (code == STATUS_RATE_LIMITED) {
        return FetchResult::rate_limited("upstream returned 429");
    }
    if (code != STATUS_OK) {
        auto error = string_field(reply, "Error");
        return FetchResult::unavailable("upstream returned " + std::to_string(code) +
                                        (error ? ": " + *error : std::string()));
    }

    auto close = number_field(reply, "Close");
    if (!close) {
        return FetchResult::unavailable("reply has no Close field");
    }
    return FetchResult::success(*close);
}

} // namespace crossover::feed::quote_protocol
