#pragma once

#include <core/event.hpp>
#include <set>
#include <string>

namespace Sessionizer {

/**
 * @brief Tags events as user actions (event_id in the configured action codes) or system events.
 *
 * Total: unknown codes classify as system events.
 */
class EventClassifier {
public:
    explicit EventClassifier(std::set<std::string> action_codes)
        : action_codes_(std::move(action_codes)) {}

    bool is_user_action(const std::string& event_id) const {
        return action_codes_.count(event_id) != 0;
    }

    ClassifiedEvent classify(Event event) const {
        ClassifiedEvent out;
        static_cast<Event&>(out) = std::move(event);
        out.is_user_action = is_user_action(out.event_id);
        return out;
    }

    const std::set<std::string>& action_codes() const { return action_codes_; }

private:
    std::set<std::string> action_codes_;
};

} // namespace Sessionizer
