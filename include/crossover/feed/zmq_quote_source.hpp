// include/crossover/feed/zmq_quote_source.hpp
#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <zmq.hpp>
#include "crossover/feed/quote_source.hpp"

namespace crossover {
namespace feed {

/**
 * @class ZmqQuoteSource
 * @brief QuoteSource backed by a request/reply quote gateway
 *
 * One outstanding request at a time over a REQ socket. A reply that does not
 * arrive within the timeout leaves the REQ socket unusable, so it is closed
 * and reconnected before the next request.
 */
class ZmqQuoteSource : public QuoteSource {
public:
    ZmqQuoteSource(std::string endpoint, std::chrono::milliseconds timeout);
    ~ZmqQuoteSource() override;

    FetchResult fetch(const core::Instrument& instrument, core::Resolution resolution) override;

private:
    void connect();

    std::string endpoint_;
    std::chrono::milliseconds timeout_;
    zmq::context_t context_;
    std::unique_ptr<zmq::socket_t> socket_;
};

} // namespace feed
} // namespace crossover
