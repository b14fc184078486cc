#pragma once

/// @file native_mode.hpp
/// @brief Owning handle around one platform mode descriptor

#include "fwd.hpp"
#include "types.hpp"

namespace vidmode_display {

// =============================================================================
// NativeModeHandle
// =============================================================================

/// Move-only owner of one reference to a native mode descriptor.
///
/// The handle releases its reference exactly once, on reset() or
/// destruction. The platform must outlive every handle created from it.
class NativeModeHandle {
public:
    /// Construct empty handle
    NativeModeHandle() noexcept = default;

    /// Take ownership of a reference the caller already holds
    [[nodiscard]] static NativeModeHandle adopt(IDisplayPlatform& platform, NativeModeRef ref) noexcept;

    /// Add a new reference and own it
    [[nodiscard]] static NativeModeHandle retain(IDisplayPlatform& platform, NativeModeRef ref);

    ~NativeModeHandle();

    // Non-copyable
    NativeModeHandle(const NativeModeHandle&) = delete;
    NativeModeHandle& operator=(const NativeModeHandle&) = delete;

    // Movable
    NativeModeHandle(NativeModeHandle&& other) noexcept;
    NativeModeHandle& operator=(NativeModeHandle&& other) noexcept;

    /// Get the descriptor reference
    [[nodiscard]] NativeModeRef get() const noexcept { return m_ref; }

    /// Get the owning platform (nullptr if empty)
    [[nodiscard]] IDisplayPlatform* platform() const noexcept { return m_platform; }

    /// Check if handle owns a reference
    [[nodiscard]] bool is_valid() const noexcept { return m_ref != NativeModeRef::Null; }

    explicit operator bool() const noexcept { return is_valid(); }

    /// Release the reference now
    void reset() noexcept;

    /// Create a second owning handle to the same descriptor
    [[nodiscard]] NativeModeHandle clone() const;

    /// Query descriptor properties
    [[nodiscard]] NativeModeInfo info() const;

private:
    NativeModeHandle(IDisplayPlatform* platform, NativeModeRef ref) noexcept
        : m_platform(platform), m_ref(ref) {}

    IDisplayPlatform* m_platform = nullptr;
    NativeModeRef m_ref = NativeModeRef::Null;
};

} // namespace vidmode_display
