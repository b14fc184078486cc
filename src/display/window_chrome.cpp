/// @file window_chrome.cpp
/// @brief RecordingWindowChrome implementation

#include <vidmode/display/window_chrome.hpp>
#include <vidmode/core/log.hpp>

namespace vidmode_display {

void RecordingWindowChrome::suppress_chrome() {
    ++m_suppress_count;
    m_suppressed = true;
    vidmode_core::display_logger()->debug("Chrome suppressed");
}

void RecordingWindowChrome::restore_chrome() {
    ++m_restore_count;
    m_suppressed = false;
    vidmode_core::display_logger()->debug("Chrome restored");
}

} // namespace vidmode_display
