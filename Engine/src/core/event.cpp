#include <core/event.hpp>

namespace Sessionizer {

bool operator==(const SessionedEvent& a, const SessionedEvent& b) {
    return EventKey::of(a) == EventKey::of(b) &&
           a.payload == b.payload &&
           a.is_user_action == b.is_user_action &&
           a.time_diff == b.time_diff &&
           a.is_new_session == b.is_new_session &&
           a.session_group_seq == b.session_group_seq &&
           a.session_start_time == b.session_start_time &&
           a.session_id == b.session_id &&
           a.pdate == b.pdate;
}

} // namespace Sessionizer
