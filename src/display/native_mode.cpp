/// @file native_mode.cpp
/// @brief NativeModeHandle implementation

#include <vidmode/display/native_mode.hpp>
#include <vidmode/display/platform.hpp>

#include <utility>

namespace vidmode_display {

NativeModeHandle NativeModeHandle::adopt(IDisplayPlatform& platform, NativeModeRef ref) noexcept {
    if (ref == NativeModeRef::Null) {
        return NativeModeHandle{};
    }
    return NativeModeHandle{&platform, ref};
}

NativeModeHandle NativeModeHandle::retain(IDisplayPlatform& platform, NativeModeRef ref) {
    if (ref == NativeModeRef::Null) {
        return NativeModeHandle{};
    }
    platform.retain_mode(ref);
    return NativeModeHandle{&platform, ref};
}

NativeModeHandle::~NativeModeHandle() {
    reset();
}

NativeModeHandle::NativeModeHandle(NativeModeHandle&& other) noexcept
    : m_platform(std::exchange(other.m_platform, nullptr))
    , m_ref(std::exchange(other.m_ref, NativeModeRef::Null))
{
}

NativeModeHandle& NativeModeHandle::operator=(NativeModeHandle&& other) noexcept {
    if (this != &other) {
        reset();
        m_platform = std::exchange(other.m_platform, nullptr);
        m_ref = std::exchange(other.m_ref, NativeModeRef::Null);
    }
    return *this;
}

void NativeModeHandle::reset() noexcept {
    if (m_platform && m_ref != NativeModeRef::Null) {
        m_platform->release_mode(m_ref);
    }
    m_platform = nullptr;
    m_ref = NativeModeRef::Null;
}

NativeModeHandle NativeModeHandle::clone() const {
    if (!m_platform) {
        return NativeModeHandle{};
    }
    return retain(*m_platform, m_ref);
}

NativeModeInfo NativeModeHandle::info() const {
    if (!m_platform || m_ref == NativeModeRef::Null) {
        return NativeModeInfo{};
    }
    return m_platform->mode_info(m_ref);
}

} // namespace vidmode_display
