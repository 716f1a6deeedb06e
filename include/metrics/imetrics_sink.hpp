#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ldapauth {

/**
 * @brief Fire-and-forget counters and gauges, provided by the host application
 *
 * Tags are "key:value" strings. Implementations must be thread-safe; calls
 * come from whichever thread is handling the login.
 */
class IMetricsSink {
public:
    virtual ~IMetricsSink() = default;

    virtual void incr(std::string_view stat, long value,
                      const std::vector<std::string>& tags) = 0;

    virtual void gauge(std::string_view stat, double value,
                       const std::vector<std::string>& tags) = 0;
};

/// Discards everything.
class NullMetricsSink final : public IMetricsSink {
public:
    void incr(std::string_view, long, const std::vector<std::string>&) override {}
    void gauge(std::string_view, double, const std::vector<std::string>&) override {}
};

} // namespace ldapauth
