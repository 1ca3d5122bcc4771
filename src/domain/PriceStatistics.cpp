#include "domain/PriceStatistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace bidlens::domain {

PriceSnapshot PriceStatistics::ComputeSnapshot(const std::vector<PriceComparable>& comparables, const std::string& query) {
    PriceSnapshot snapshot;
    snapshot.query = query;

    std::vector<double> all;
    all.reserve(comparables.size());
    for (const auto& sale : comparables) {
        if (sale.price > 0.0 && std::isfinite(sale.price)) {
            all.push_back(sale.price);
        }
    }
    if (all.empty()) {
        return snapshot;
    }

    snapshot.count = static_cast<int>(all.size());
    snapshot.prices.assign(all.begin(), all.begin() + std::min(all.size(), kRecentSampleSize));
    std::sort(snapshot.prices.begin(), snapshot.prices.end());

    std::vector<double> sorted = all;
    std::sort(sorted.begin(), sorted.end());

    const double n = static_cast<double>(sorted.size());
    snapshot.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / n;
    snapshot.min = sorted.front();
    snapshot.max = sorted.back();

    const std::size_t mid = sorted.size() / 2;
    snapshot.median = sorted.size() % 2 == 0 ? (sorted[mid - 1] + sorted[mid]) / 2.0 : sorted[mid];

    double sumSq = 0.0;
    for (double price : sorted) {
        sumSq += (price - snapshot.mean) * (price - snapshot.mean);
    }
    snapshot.standardDeviation = std::sqrt(sumSq / n);
    return snapshot;
}

} // namespace bidlens::domain
