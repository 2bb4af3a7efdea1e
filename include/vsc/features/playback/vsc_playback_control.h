/**
 * @file vsc_playback_control.h
 * @brief VoiceStream Commons - Playback Control Capability
 *
 * Transport controls of whatever device plays the session's audio. The host
 * supplies the implementation (AlsaPlayback on Linux, a fake in tests).
 */

#ifndef VSC_PLAYBACK_CONTROL_H
#define VSC_PLAYBACK_CONTROL_H

#include <functional>

namespace vsc {

class PlaybackControl {
public:
    virtual ~PlaybackControl() = default;

    // Returns false if playback could not start (no device, nothing buffered)
    virtual bool play() = 0;
    virtual void pause() = 0;
    virtual bool is_playing() const = 0;

    /**
     * Invoked when every buffered byte of a completed stream has been played.
     * May run on any thread. Passing nullptr clears the callback; once the
     * setter returns the previous callback is no longer running.
     */
    virtual void set_on_ended(std::function<void()> callback) = 0;
};

}  // namespace vsc

#endif  // VSC_PLAYBACK_CONTROL_H
