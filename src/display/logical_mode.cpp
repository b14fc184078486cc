/// @file logical_mode.cpp
/// @brief LogicalMode implementation

#include <vidmode/display/logical_mode.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace vidmode_display {

LogicalMode::LogicalMode(const DisplayMode& mode, NativeModeHandle first)
    : m_mode(mode)
{
    if (first) {
        m_candidates.push_back(std::move(first));
    }
}

bool LogicalMode::has_candidate(NativeModeRef ref) const {
    return std::any_of(m_candidates.begin(), m_candidates.end(),
        [ref](const NativeModeHandle& h) { return h.get() == ref; });
}

bool LogicalMode::add_candidate(NativeModeHandle handle) {
    if (!handle || has_candidate(handle.get())) {
        return false;  // handle goes out of scope and drops its reference
    }
    m_candidates.push_back(std::move(handle));
    return true;
}

std::size_t LogicalMode::merge(LogicalMode&& other) {
    std::size_t taken = 0;
    for (auto& handle : other.m_candidates) {
        if (add_candidate(std::move(handle))) {
            ++taken;
        }
    }
    other.m_candidates.clear();
    return taken;
}

void LogicalMode::promote(std::size_t index) {
    if (index == 0 || index >= m_candidates.size()) {
        return;
    }
    auto first = m_candidates.begin();
    std::rotate(first, std::next(first, static_cast<std::ptrdiff_t>(index)),
                std::next(first, static_cast<std::ptrdiff_t>(index) + 1));
}

void LogicalMode::release_candidates() noexcept {
    // Clearing destroys each handle once, dropping its reference
    m_candidates.clear();
}

} // namespace vidmode_display
