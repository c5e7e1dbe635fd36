// SPDX-License-Identifier: Apache-2.0
#include "ConfirmationPolicy.hpp"

#include <core/Log.hpp>

#include <algorithm>

namespace bargein
{

ConsecutiveConfirmationPolicy::ConsecutiveConfirmationPolicy(ConsecutivePolicyConfig config):
    _config(config)
{
    _config.threshold = std::max(1, _config.threshold);
}

void ConsecutiveConfirmationPolicy::reset(DetectionClock::time_point sessionStart)
{
    _sessionStart = sessionStart;
    _count = 0;
    _confirmed = false;
}

auto ConsecutiveConfirmationPolicy::isPositive(const DetectionEvent& event) const -> bool
{
    if (!event.speechPresent)
        return false;
    return !event.confidence || *event.confidence >= _config.minConfidence;
}

auto ConsecutiveConfirmationPolicy::observe(const DetectionEvent& event) -> bool
{
    if (_confirmed)
        return false;

    if (event.timestamp < _sessionStart + _config.startupGrace)
    {
        log::trace("Policy: event within startup grace, ignored");
        return false;
    }

    if (isPositive(event))
        ++_count;
    else if (_config.decayOnNegative)
        _count = std::max(0, _count - 1);
    else
        _count = 0;

    log::trace("Policy: speech={} count={}/{}", event.speechPresent, _count, _config.threshold);

    if (_count < _config.threshold)
        return false;

    _confirmed = true;
    return true;
}

} // namespace bargein
