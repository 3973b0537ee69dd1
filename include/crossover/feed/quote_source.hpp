// include/crossover/feed/quote_source.hpp
#pragma once
#include <memory>
#include <string>
#include "crossover/core/market_data.hpp"

namespace crossover {
namespace feed {

enum class FetchStatus {
    OK,
    RATE_LIMITED,  // upstream throttling; worth retrying
    UNAVAILABLE    // anything else; skip this tick
};

const char* to_string(FetchStatus status);

struct FetchResult {
    FetchStatus status = FetchStatus::UNAVAILABLE;
    double price = 0.0;
    std::string detail;

    bool ok() const { return status == FetchStatus::OK; }

    static FetchResult success(double price);
    static FetchResult rate_limited(std::string detail = "");
    static FetchResult unavailable(std::string detail);
};

// Last traded price of an instrument at a bar resolution.
class QuoteSource {
public:
    virtual ~QuoteSource() = default;

    virtual FetchResult fetch(const core::Instrument& instrument, core::Resolution resolution) = 0;
};

using QuoteSourcePtr = std::shared_ptr<QuoteSource>;

} // namespace feed
} // namespace crossover
