/// @file device.cpp
/// @brief Device and DisplayStore implementation

#include <vidmode/display/device.hpp>

#include <algorithm>
#include <utility>

namespace vidmode_display {

// =============================================================================
// Device
// =============================================================================

LogicalMode* Device::find_mode(const DisplayMode& mode) {
    auto it = std::find_if(modes.begin(), modes.end(),
        [&mode](const LogicalMode& m) { return m == mode; });
    return it != modes.end() ? &*it : nullptr;
}

const LogicalMode* Device::find_mode(const DisplayMode& mode) const {
    auto it = std::find_if(modes.begin(), modes.end(),
        [&mode](const LogicalMode& m) { return m == mode; });
    return it != modes.end() ? &*it : nullptr;
}

// =============================================================================
// DisplayStore
// =============================================================================

Device& DisplayStore::add_device(Device device) {
    m_devices.push_back(std::make_unique<Device>(std::move(device)));
    return *m_devices.back();
}

AddModeResult DisplayStore::add_mode(Device& device, LogicalMode& mode) {
    if (device.find_mode(mode.mode())) {
        return AddModeResult::Duplicate;
    }
    device.modes.push_back(std::move(mode));
    return AddModeResult::Accepted;
}

std::vector<Device*> DisplayStore::devices() {
    std::vector<Device*> result;
    result.reserve(m_devices.size());
    for (auto& device : m_devices) {
        result.push_back(device.get());
    }
    return result;
}

Device* DisplayStore::find(DeviceId id) {
    auto it = std::find_if(m_devices.begin(), m_devices.end(),
        [id](const auto& d) { return d->id == id; });
    return it != m_devices.end() ? it->get() : nullptr;
}

Device* DisplayStore::at(std::size_t index) {
    return index < m_devices.size() ? m_devices[index].get() : nullptr;
}

void DisplayStore::clear() {
    m_devices.clear();
}

} // namespace vidmode_display
