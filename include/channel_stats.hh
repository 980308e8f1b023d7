// include/channel_stats.hh
#ifndef CHANNEL_STATS_HH
#define CHANNEL_STATS_HH

#include <cstdint>
#include <cstdio>
#include <limits>
#include <string>
#include <nlohmann/json.hpp>

struct ChannelStats {
    uint64_t sent = 0;          // messages accepted by send/publish
    uint64_t delivered = 0;     // handler invocations that returned normally
    uint64_t dropped = 0;       // destination gone at delivery time
    uint64_t failed = 0;        // handler threw
    double total_delay = 0.0;
    double min_delay = std::numeric_limits<double>::max();
    double max_delay = 0.0;

    void reset() {
        sent = delivered = dropped = failed = 0;
        total_delay = 0.0;
        min_delay = std::numeric_limits<double>::max();
        max_delay = 0.0;
    }

    void recordDelay(double d) {
        total_delay += d;
        if (d < min_delay) min_delay = d;
        if (d > max_delay) max_delay = d;
    }

    void merge(const ChannelStats& other) {
        sent += other.sent;
        delivered += other.delivered;
        dropped += other.dropped;
        failed += other.failed;
        total_delay += other.total_delay;
        if (other.min_delay < min_delay) min_delay = other.min_delay;
        if (other.max_delay > max_delay) max_delay = other.max_delay;
    }

    double avgDelay() const {
        uint64_t n = delivered + failed;
        return n ? total_delay / n : 0.0;
    }

    std::string toString() const;
    nlohmann::json toJson() const;
};

inline std::string ChannelStats::toString() const {
    char buf[256];
    snprintf(buf, sizeof(buf),
             "sent=%llu delivered=%llu dropped=%llu failed=%llu delay(avg=%.4f min=%.4f max=%.4f)",
             (unsigned long long)sent, (unsigned long long)delivered,
             (unsigned long long)dropped, (unsigned long long)failed,
             avgDelay(),
             min_delay == std::numeric_limits<double>::max() ? 0.0 : min_delay,
             max_delay);
    return std::string(buf);
}

inline nlohmann::json ChannelStats::toJson() const {
    return {
        {"sent", sent},
        {"delivered", delivered},
        {"dropped", dropped},
        {"failed", failed},
        {"avg_delay", avgDelay()},
        {"min_delay", min_delay == std::numeric_limits<double>::max() ? 0.0 : min_delay},
        {"max_delay", max_delay}
    };
}

#endif // CHANNEL_STATS_HH
