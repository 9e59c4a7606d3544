#ifndef NWSS_TOOLPATH_FEED_SAFETY_H
#define NWSS_TOOLPATH_FEED_SAFETY_H

#include <memory>
#include <string>
#include <vector>

namespace nwss {
namespace toolpath {

/**
 * Everything an adjuster may look at for one move
 */
struct FeedContext {
    double baseFeed;
    int passNum;            // 0-based; negative when the move is not tied to a pass
    bool isArc;             // G02/G03 move
    double cornerFactor;    // Corner severity at the move's end point (1.0 = no corner)

    FeedContext(double feed = 0.0, int pass = 0, bool arc = false, double corner = 1.0)
        : baseFeed(feed), passNum(pass), isArc(arc), cornerFactor(corner) {}
};

/**
 * One stage of feed reduction. Disabled adjusters pass the feed through.
 */
class FeedAdjuster {
public:
    virtual ~FeedAdjuster() = default;

    /**
     * @param feed Feed coming out of the previous stage
     * @param context Move being adjusted
     * @return Adjusted feed
     */
    virtual double adjustFeed(double feed, const FeedContext& context) const = 0;
    virtual bool isEnabled() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Slows the first pass, which sees the most material and the hardest entry
 */
class FirstPassAdjuster : public FeedAdjuster {
public:
    explicit FirstPassAdjuster(double factor) : m_factor(factor) {}

    double adjustFeed(double feed, const FeedContext& context) const override;
    bool isEnabled() const override { return m_factor < 1.0; }
    std::string name() const override { return "first_pass"; }

private:
    double m_factor;
};

/**
 * Slows moves that end in a sharp corner (corner_feed_factor x severity)
 */
class CornerSlowdownAdjuster : public FeedAdjuster {
public:
    CornerSlowdownAdjuster(bool enabled, double factor) : m_enabled(enabled), m_factor(factor) {}

    double adjustFeed(double feed, const FeedContext& context) const override;
    bool isEnabled() const override { return m_enabled; }
    std::string name() const override { return "corner_slowdown"; }

private:
    bool m_enabled;
    double m_factor;
};

/**
 * Slows arc moves
 */
class ArcSlowdownAdjuster : public FeedAdjuster {
public:
    ArcSlowdownAdjuster(bool enabled, double factor) : m_enabled(enabled), m_factor(factor) {}

    double adjustFeed(double feed, const FeedContext& context) const override;
    bool isEnabled() const override { return m_enabled; }
    std::string name() const override { return "arc_slowdown"; }

private:
    bool m_enabled;
    double m_factor;
};

/**
 * Runs registered adjusters in registration order; each enabled stage
 * multiplies into the result
 */
class SafetyCoordinator {
public:
    SafetyCoordinator() = default;

    void registerAdjuster(std::unique_ptr<FeedAdjuster> adjuster);

    double getAdjustedFeed(const FeedContext& context) const;
    double getAdjustedFeed(double baseFeed, int passNum, bool isArc = false,
                           double cornerFactor = 1.0) const;

    size_t adjusterCount() const { return m_adjusters.size(); }
    std::vector<std::string> enabledAdjusters() const;

    /**
     * Coordinator with the standard First-Pass -> Corner -> Arc chain
     */
    static SafetyCoordinator create(double firstPassFactor,
                                    bool cornerEnabled, double cornerFactor,
                                    bool arcEnabled, double arcFactor);

private:
    std::vector<std::unique_ptr<FeedAdjuster>> m_adjusters;
};

} // namespace toolpath
} // namespace nwss

#endif // NWSS_TOOLPATH_FEED_SAFETY_H
