#include "resonant/configuration.hpp"

#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <boost/lexical_cast.hpp>
#include <fmt/format.h>

#include "resonant/ensure.hpp"

namespace resonant {

namespace {

    template <typename T>
    void fillvar(const char* envvar, T& var) {
        const char* val = std::getenv(envvar);
        if (val != nullptr && std::strlen(val) > 0) {
            try {
                var = boost::lexical_cast<T>(val);
            } catch (boost::bad_lexical_cast const&) {
                throw std::invalid_argument(fmt::format("Invalid value of {}: {}", envvar, val));
            }
        }
    }

    void ensure_non_negative(double value, const char* name) {
        ensure(value >= 0.0).or_throw_with("{} must be non-negative, got {}", name, value);
    }

}  // namespace

void EngineConfig::validate() const {
    ensure_non_negative(entropy_weight, "entropy_weight");
    ensure_non_negative(fragility, "fragility");
    ensure_non_negative(trend_decay, "trend_decay");
    ensure_non_negative(update_frequency, "update_frequency");
    ensure(dense_dimension > 0).or_throw(std::invalid_argument("dense_dimension must be positive"));
}

void CrawlerConfig::validate() const {
    ensure(max_concurrent_requests > 0)
        .or_throw(std::invalid_argument("max_concurrent_requests must be positive"));
    ensure(workers > 0).or_throw(std::invalid_argument("number of workers must be positive"));
    ensure(channel_capacity > 0).or_throw(std::invalid_argument("channel capacity must be positive"));
    ensure(crawl_delay.count() >= 0).or_throw(std::invalid_argument("crawl delay is negative"));
    ensure(not user_agent.empty()).or_throw(std::invalid_argument("user agent must not be empty"));
}

void apply_environment(EngineConfig& config) {
    fillvar("RESONANT_ENTROPY_WEIGHT", config.entropy_weight);
    fillvar("RESONANT_FRAGILITY", config.fragility);
    fillvar("RESONANT_TREND_DECAY", config.trend_decay);
    fillvar("RESONANT_UPDATE_FREQUENCY", config.update_frequency);
    fillvar("RESONANT_DENSE_DIMENSION", config.dense_dimension);
}

void apply_environment(CrawlerConfig& config) {
    auto delay = config.crawl_delay.count();
    fillvar("RESONANT_CRAWL_DELAY", delay);
    config.crawl_delay = std::chrono::milliseconds(delay);
    fillvar("RESONANT_USER_AGENT", config.user_agent);
}

}  // namespace resonant
