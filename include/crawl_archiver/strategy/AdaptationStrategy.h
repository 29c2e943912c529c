#pragma once

#include <string>
#include "../monitor/MonitorEvent.h"

namespace crawl_archiver { namespace strategy {

/**
 * One corrective action the control loop can take when the monitor reports a
 * stall or an error storm. Implementations enforce their own caps and
 * cooldowns and record what they did in the job state.
 */
class AdaptationStrategy {
public:
    virtual ~AdaptationStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * Try the action for `event`.
     * @return true if the action was performed, false if skipped or failed
     */
    virtual bool attempt(const monitor::MonitorEvent& event) = 0;

    // Whether a successful attempt needs the current container stopped and resumed
    virtual bool requiresRestart() const = 0;
};

} } // namespace crawl_archiver::strategy
