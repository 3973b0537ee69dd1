#include "crossover/feed/quote_source.hpp"

namespace crossover::feed {

const char* to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::OK:
            return "OK";
        case FetchStatus::RATE_LIMITED:
            return "RATE_LIMITED";
        case FetchStatus::UNAVAILABLE:
            return "UNAVAILABLE";
    }
    return "?";
}

FetchResult FetchResult::success(double price) {
    FetchResult result;
    result.status = FetchStatus::OK;
    result.price = price;
    return result;
}

FetchResult FetchResult::rate_limited(std::string detail) {
    FetchResult result;
    result.status = FetchStatus::RATE_LIMITED;
    result.detail = std::move(detail);
    return result;
}

FetchResult FetchResult::unavailable(std::string detail) {
    FetchResult result;
    result.status = FetchStatus::UNAVAILABLE;
    result.detail = std::move(detail);
    return result;
}

} // namespace crossover::feed
