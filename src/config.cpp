#include "pulselink/core/config.hpp"

#include "pulselink/core/transport/url.hpp"
#include "lcr/log/logger.hpp"


namespace pulselink::core {

Error validate(const Config& cfg) {
    transport::ParsedUrl parsed;
    if (transport::parse_url(cfg.url, parsed) != Error::None) {
        PL_ERROR("[CONFIG] Invalid url: '" << cfg.url << "'");
        return Error::InvalidUrl;
    }
    if (cfg.queue.capacity == 0) {
        PL_ERROR("[CONFIG] queue.capacity must be greater than zero");
        return Error::InvalidConfig;
    }
    if (cfg.backoff.base_delay.count() <= 0) {
        PL_ERROR("[CONFIG] backoff.base_delay must be positive");
        return Error::InvalidConfig;
    }
    if (cfg.backoff.max_delay < cfg.backoff.base_delay) {
        PL_ERROR("[CONFIG] backoff.max_delay (" << cfg.backoff.max_delay.count()
              << " ms) is below backoff.base_delay (" << cfg.backoff.base_delay.count() << " ms)");
        return Error::InvalidConfig;
    }
    if (!(cfg.backoff.jitter_ratio >= 0.0 && cfg.backoff.jitter_ratio <= 1.0)) {
        PL_ERROR("[CONFIG] backoff.jitter_ratio must be within [0, 1]");
        return Error::InvalidConfig;
    }
    if (cfg.connect_timeout.count() <= 0) {
        PL_ERROR("[CONFIG] connect_timeout must be positive");
        return Error::InvalidConfig;
    }
    if (cfg.heartbeat.interval.count() <= 0) {
        PL_ERROR("[CONFIG] heartbeat.interval must be positive");
        return Error::InvalidConfig;
    }
    // The first tick of a quiet connection precedes any probe
    if (cfg.heartbeat.max_missed < 2) {
        PL_ERROR("[CONFIG] heartbeat.max_missed must be at least 2");
        return Error::InvalidConfig;
    }
    if (cfg.subscriptions.announce
        && (cfg.subscriptions.subscribe_type.empty() || cfg.subscriptions.unsubscribe_type.empty())) {
        PL_ERROR("[CONFIG] subscriptions.subscribe_type / unsubscribe_type must not be empty");
        return Error::InvalidConfig;
    }
    if (cfg.platform.empty()) {
        PL_ERROR("[CONFIG] platform must not be empty");
        return Error::InvalidConfig;
    }
    return Error::None;
}

} // namespace pulselink::core
