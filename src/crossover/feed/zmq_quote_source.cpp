// src/crossover/feed/zmq_quote_source.cpp
#include "crossover/feed/zmq_quote_source.hpp"
#include "crossover/feed/quote_protocol.hpp"
#include "crossover/utils/logger.hpp"

namespace crossover {
namespace feed {

ZmqQuoteSource::ZmqQuoteSource(std::string endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout), context_(1) {
    connect();
}

ZmqQuoteSource::~ZmqQuoteSource() {
    if (socket_) {
        socket_->close();
    }
}

void ZmqQuoteSource::connect() {
    if (socket_) {
        socket_->close();
    }

    socket_ = std::make_unique<zmq::socket_t>(context_, zmq::socket_type::req);
    socket_->set(zmq::sockopt::linger, 0);
    socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_.count()));
    socket_->set(zmq::sockopt::sndtimeo, static_cast<int>(timeout_.count()));
    socket_->connect(endpoint_);

    utils::Logger::debug() << "Connected to quote gateway at " << endpoint_ << utils::Logger::endl;
}

FetchResult ZmqQuoteSource::fetch(const core::Instrument& instrument, core::Resolution resolution) {
    std::string request = quote_protocol::encode_request(instrument, resolution);

    try {
        if (!socket_) {
            connect();
        }

        auto sent = socket_->send(zmq::buffer(request), zmq::send_flags::none);
        if (!sent) {
            connect();
            return FetchResult::unavailable("send to " + endpoint_ + " timed out");
        }

        zmq::message_t reply;
        auto received = socket_->recv(reply, zmq::recv_flags::none);
        if (!received) {
            // REQ socket is stuck waiting for this reply; start over.
            connect();
            return FetchResult::unavailable("no reply from " + endpoint_ + " within " +
                                            std::to_string(timeout_.count()) + "ms");
        }

        return quote_protocol::decode_reply(reply.to_string());
    } catch (const zmq::error_t& e) {
        utils::Logger::error() << "Quote gateway error for " << instrument.symbol << ": " << e.what()
                               << utils::Logger::endl;
        socket_.reset();
        return FetchResult::unavailable(e.what());
    }
}

} // namespace feed
} // namespace crossover
