#include <crossover/core/price_window.hpp>
#include <stdexcept>
#include <string>

namespace crossover::core {

PriceWindow::PriceWindow(size_t capacity)
    : prices_(capacity) {}

void PriceWindow::push(double price) {
    prices_.push(price);
}

void PriceWindow::fill(double price) {
    prices_.clear();
    for (size_t i = 0; i < prices_.capacity(); ++i) {
        prices_.push(price);
    }
}

double PriceWindow::mean_of_last(size_t count) const {
    if (count == 0 || count > prices_.size()) {
        throw std::out_of_range("mean_of_last: window holds " + std::to_string(prices_.size()) +
                                " prices, asked for " + std::to_string(count));
    }

    double sum = 0.0;
    for (size_t i = prices_.size() - count; i < prices_.size(); ++i) {
        sum += prices_[i];
    }
    return sum / static_cast<double>(count);
}

std::vector<double> PriceWindow::snapshot() const {
    std::vector<double> out;
    out.reserve(prices_.size());
    for (size_t i = 0; i < prices_.size(); ++i) {
        out.push_back(prices_[i]);
    }
    return out;
}

} // namespace crossover::core
