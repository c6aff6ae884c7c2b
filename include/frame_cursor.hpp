#ifndef QRDROP_RECV_FRAME_CURSOR_HPP
#define QRDROP_RECV_FRAME_CURSOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qrdrop::recv {

/// One step of a scan: the frame's label (file name) and its decoded
/// payload, or no payload when nothing readable was found in the image.
struct ScannedFrame {
    std::string                         label;
    std::optional<std::vector<uint8_t>> payload;
};

/// Ordered, restartable sequence of decoded frames.
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    /// Next frame, or nullopt at the end of the sequence.
    virtual std::optional<ScannedFrame> next() = 0;

    /// Start again from the first frame.
    virtual void restart() = 0;
};

/// Forward cursor over a PayloadSource with a single-step rewind.
///
/// unread() makes the next call to next() return the last frame again.
/// It may be used once per run; further calls are refused.
class FrameCursor {
public:
    explicit FrameCursor(PayloadSource& source) : source_(source) {}

    FrameCursor(const FrameCursor&) = delete;
    FrameCursor& operator=(const FrameCursor&) = delete;

    std::optional<ScannedFrame> next();

    /// Step back by one frame. Returns false if nothing was read yet, the
    /// rewind is already pending, or it was used before.
    bool unread();

    /// Number of frames handed out so far, replays excluded.
    std::size_t position() const noexcept { return position_; }

private:
    PayloadSource&              source_;
    std::optional<ScannedFrame> last_;
    bool                        replay_      = false;
    bool                        unread_used_ = false;
    std::size_t                 position_    = 0;
};

} // namespace qrdrop::recv

#endif // QRDROP_RECV_FRAME_CURSOR_HPP
