#pragma once
#include <optional>
#include <string>
#include "crossover/core/market_data.hpp"
#include "crossover/feed/quote_source.hpp"

namespace crossover::feed {

// Single-frame JSON messages exchanged with the quote gateway.
//   request: {"Symbol":"TSLA","Exchange":"NASDAQ","Screener":"america","Interval":"1m"}
//   reply:   {"Status":200,"Close":251.37}   429 means rate limited
namespace quote_protocol {

constexpr int STATUS_OK = 200;
constexpr int STATUS_RATE_LIMITED = 429;

std::string encode_request(const core::Instrument& instrument, core::Resolution resolution);

// Maps a reply to OK / RATE_LIMITED / UNAVAILABLE. Never throws.
FetchResult decode_reply(const std::string& reply);

// Flat-object field extraction; nullopt if the key is absent or malformed.
std::optional<std::string> string_field(const std::string& json, const std::string& key);
std::optional<double> number_field(const std::string& json, const std::string& key);

} // namespace quote_protocol

} // namespace crossover::feed
