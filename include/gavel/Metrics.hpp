#ifndef GAVEL_METRICS_HPP
#define GAVEL_METRICS_HPP

#include "gavel/AuctionTypes.hpp"
#include <mutex>

namespace gavel {

    // Contadores globales del motor. Thread safe.
    class MetricsAggregator {
        public:
            MetricsAggregator() = default;

            void auctionCreated(Timestamp now);
            void auctionClosed(Timestamp now);
            void volumeAdded(Amount amount, Timestamp now);

            SystemMetrics snapshot() const;

        private:
            mutable std::mutex mtx;
            SystemMetrics metrics;
    };

} // namespace gavel

#endif // GAVEL_METRICS_HPP
