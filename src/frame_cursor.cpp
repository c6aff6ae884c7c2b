#include "frame_cursor.hpp"

namespace qrdrop::recv {

std::optional<ScannedFrame> FrameCursor::next() {
    if (replay_) {
        replay_ = false;
        return last_;
    }

    last_ = source_.next();
    if (last_) ++position_;
    return last_;
}

bool FrameCursor::unread() {
    if (unread_used_ || replay_ || !last_) return false;
    replay_      = true;
    unread_used_ = true;
    return true;
}

} // namespace qrdrop::recv
