#include <crossover/core/preloader.hpp>
#include <crossover/utils/logger.hpp>

namespace crossover::core {

Preloader::Preloader(feed::QuoteFetcher& fetcher, Clock& clock, std::chrono::milliseconds delay)
    : fetcher_(fetcher), clock_(clock), delay_(delay) {}

bool Preloader::preload_window(InstrumentState& state, PriceWindow& window, Resolution resolution) {
    const auto& symbol = state.instrument.symbol;
    auto result = fetcher_.fetch_once(state.instrument, resolution);

    switch (result.status) {
        case feed::FetchStatus::OK:
            window.fill(result.price);
            utils::Logger::info() << symbol << ": Preloaded " << resolution << " MA history with "
                                  << result.price << utils::Logger::endl;
            return true;
        case feed::FetchStatus::RATE_LIMITED:
            utils::Logger::warn() << symbol << ": Skipped " << resolution
                                  << " preload due to rate limit (429). MA will build over time."
                                  << utils::Logger::endl;
            return false;
        case feed::FetchStatus::UNAVAILABLE:
            utils::Logger::warn() << symbol << ": Error preloading " << resolution << " history: "
                                  << result.detail << utils::Logger::endl;
            return false;
    }
    return false;
}

size_t Preloader::preload(std::vector<InstrumentState>& table,
                          Resolution high_freq_resolution,
                          Resolution low_freq_resolution,
                          const utils::CancellationToken& token) {
    size_t filled = 0;

    for (auto& state : table) {
        if (token.is_cancelled()) {
            break;
        }

        if (preload_window(state, state.high_freq_window, high_freq_resolution)) {
            ++filled;
        }
        if (!clock_.sleep_for(delay_, token)) {
            break;
        }

        if (preload_window(state, state.low_freq_window, low_freq_resolution)) {
            ++filled;
        }
        if (!clock_.sleep_for(delay_, token)) {
            break;
        }
    }

    utils::Logger::info() << "Preload complete: " << filled << "/" << table.size() * 2
                          << " windows warmed" << utils::Logger::endl;
    return filled;
}

} // namespace crossover::core
