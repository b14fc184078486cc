#pragma once

/// @file device.hpp
/// @brief Display devices and their storage

#include "fwd.hpp"
#include "types.hpp"
#include "logical_mode.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vidmode_display {

// =============================================================================
// Device
// =============================================================================

/// One physical output
struct Device {
    /// Native display identifier
    DeviceId id = k_null_device;
    /// Product name (best-effort)
    std::optional<std::string> name;
    /// Bounds in global coordinates at discovery time
    Rect bounds;
    /// Was this the main display at discovery time?
    bool primary = false;
    /// Mode in use under normal operation; restore target at shutdown
    LogicalMode desktop_mode;
    /// Mode the display is currently set to
    DisplayMode current_mode;
    /// Supported modes, no two logically equal
    std::vector<LogicalMode> modes;

    /// Find the listed mode equal to a description
    [[nodiscard]] LogicalMode* find_mode(const DisplayMode& mode);
    [[nodiscard]] const LogicalMode* find_mode(const DisplayMode& mode) const;

    /// Check if display is in its desktop mode
    [[nodiscard]] bool is_at_desktop() const {
        return current_mode == desktop_mode.mode();
    }

    /// Get display label for logging
    [[nodiscard]] std::string label() const {
        return name ? *name + " (" + std::to_string(id) + ")" : "display " + std::to_string(id);
    }
};

// =============================================================================
// Display Store
// =============================================================================

/// Outcome of adding a mode to a device
enum class AddModeResult : std::uint8_t {
    Accepted,   ///< Store took ownership of the mode
    Duplicate,  ///< Equal mode already listed; caller keeps (and releases) it
};

/// Storage for discovered devices and their modes
class IDisplayStore {
public:
    virtual ~IDisplayStore() = default;

    /// Register a device; the returned reference stays valid until clear()
    virtual Device& add_device(Device device) = 0;

    /// Add a mode to a device. On Accepted the mode is moved from; on
    /// Duplicate it is left untouched.
    virtual AddModeResult add_mode(Device& device, LogicalMode& mode) = 0;

    /// Get registered devices in registration order
    [[nodiscard]] virtual std::vector<Device*> devices() = 0;

    /// Get device count
    [[nodiscard]] virtual std::size_t device_count() const = 0;
};

/// In-memory device store
class DisplayStore : public IDisplayStore {
public:
    DisplayStore() = default;

    // Non-copyable
    DisplayStore(const DisplayStore&) = delete;
    DisplayStore& operator=(const DisplayStore&) = delete;

    Device& add_device(Device device) override;
    AddModeResult add_mode(Device& device, LogicalMode& mode) override;
    [[nodiscard]] std::vector<Device*> devices() override;
    [[nodiscard]] std::size_t device_count() const override { return m_devices.size(); }

    /// Find device by native identifier
    [[nodiscard]] Device* find(DeviceId id);

    /// Get device by registration index
    [[nodiscard]] Device* at(std::size_t index);

    /// Drop all devices (releasing any candidates still held)
    void clear();

private:
    std::vector<std::unique_ptr<Device>> m_devices;
};

} // namespace vidmode_display
