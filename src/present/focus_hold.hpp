#pragma once

#include <cstdint>

namespace screen_mirror {

// Keyboard focus borrowed by a window the window manager never focuses
// (override-redirect). Focus is taken while the pointer is inside and
// handed back to whoever had it on leave or close.
class FocusHold {
public:
    // Pointer entered window. Returns true if focus should move to it;
    // previous is the focus owner at that moment.
    bool take(uint32_t window, uint32_t previous) {
        if (m_held) {
            return false;
        }
        m_held = true;
        m_previous = previous == window ? 0 : previous;
        return true;
    }

    // Pointer left or the window is closing. Returns true with the window
    // to restore (0: let the server pick, pointer root).
    bool release(uint32_t& restore) {
        if (!m_held) {
            return false;
        }
        m_held = false;
        restore = m_previous;
        m_previous = 0;
        return true;
    }

    bool is_held() const { return m_held; }

private:
    bool m_held = false;
    uint32_t m_previous = 0;
};

}  // namespace screen_mirror
