#include "gavel/Metrics.hpp"
#include <limits>

namespace gavel {

    void MetricsAggregator::auctionCreated(Timestamp now) {
        std::lock_guard<std::mutex> lk(mtx);
        metrics.totalAuctions++;
        metrics.activeAuctions++;
        metrics.lastUpdateTimestamp = now;
    }

    void MetricsAggregator::auctionClosed(Timestamp now) {
        std::lock_guard<std::mutex> lk(mtx);
        if (metrics.activeAuctions > 0) metrics.activeAuctions--;
        metrics.lastUpdateTimestamp = now;
    }

    void MetricsAggregator::volumeAdded(Amount amount, Timestamp now) {
        std::lock_guard<std::mutex> lk(mtx);
        // satura en vez de desbordar
        if (metrics.totalVolume > std::numeric_limits<Amount>::max() - amount) {
            metrics.totalVolume = std::numeric_limits<Amount>::max();
        } else {
            metrics.totalVolume += amount;
        }
        metrics.lastUpdateTimestamp = now;
    }

    SystemMetrics MetricsAggregator::snapshot() const {
        std::lock_guard<std::mutex> lk(mtx);
        return metrics;
    }

} // namespace gavel
