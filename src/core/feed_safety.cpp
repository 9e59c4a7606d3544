#include "core/feed_safety.h"

namespace nwss {
namespace toolpath {

double FirstPassAdjuster::adjustFeed(double feed, const FeedContext& context) const {
    if (!isEnabled() || context.passNum != 0) {
        return feed;
    }
    return feed * m_factor;
}

double CornerSlowdownAdjuster::adjustFeed(double feed, const FeedContext& context) const {
    if (!m_enabled || context.cornerFactor >= 1.0) {
        return feed;
    }
    return feed * m_factor * context.cornerFactor;
}

double ArcSlowdownAdjuster::adjustFeed(double feed, const FeedContext& context) const {
    if (!m_enabled || !context.isArc) {
        return feed;
    }
    return feed * m_factor;
}

void SafetyCoordinator::registerAdjuster(std::unique_ptr<FeedAdjuster> adjuster) {
    if (adjuster) {
        m_adjusters.push_back(std::move(adjuster));
    }
}

double SafetyCoordinator::getAdjustedFeed(const FeedContext& context) const {
    double feed = context.baseFeed;
    for (const auto& adjuster : m_adjusters) {
        feed = adjuster->adjustFeed(feed, context);
    }
    return feed;
}

double SafetyCoordinator::getAdjustedFeed(double baseFeed, int passNum, bool isArc,
                                          double cornerFactor) const {
    return getAdjustedFeed(FeedContext(baseFeed, passNum, isArc, cornerFactor));
}

std::vector<std::string> SafetyCoordinator::enabledAdjusters() const {
    std::vector<std::string> names;
    for (const auto& adjuster : m_adjusters) {
        if (adjuster->isEnabled()) {
            names.push_back(adjuster->name());
        }
    }
    return names;
}

SafetyCoordinator SafetyCoordinator::create(double firstPassFactor,
                                            bool cornerEnabled, double cornerFactor,
                                            bool arcEnabled, double arcFactor) {
    SafetyCoordinator coordinator;
    coordinator.registerAdjuster(std::make_unique<FirstPassAdjuster>(firstPassFactor));
    coordinator.registerAdjuster(std::make_unique<CornerSlowdownAdjuster>(cornerEnabled, cornerFactor));
    coordinator.registerAdjuster(std::make_unique<ArcSlowdownAdjuster>(arcEnabled, arcFactor));
    return coordinator;
}

} // namespace toolpath
} // namespace nwss
