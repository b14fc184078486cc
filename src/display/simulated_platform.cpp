/// @file simulated_platform.cpp
/// @brief SimulatedPlatform implementation

#include <vidmode/display/simulated_platform.hpp>
#include <vidmode/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace vidmode_display {

// =============================================================================
// Setup
// =============================================================================

void SimulatedPlatform::add_display(const SimulatedDisplay& display) {
    DisplayEntry entry;
    entry.display = display;
    m_displays.push_back(std::move(entry));
}

NativeModeRef SimulatedPlatform::add_descriptor(DeviceId display, const NativeModeInfo& info, bool listed) {
    auto ref = static_cast<NativeModeRef>(m_next_descriptor++);

    DescriptorEntry entry;
    entry.owner = display;
    entry.info = info;
    m_descriptors.emplace(ref, std::move(entry));

    if (listed) {
        if (auto* d = find_display(display)) {
            d->listed.push_back(ref);
        }
    }
    return ref;
}

void SimulatedPlatform::set_current_mode(DeviceId display, NativeModeRef mode) {
    if (auto* d = find_display(display)) {
        d->current = mode;
    }
}

void SimulatedPlatform::set_current_mode_available(DeviceId display, bool available) {
    if (auto* d = find_display(display)) {
        d->current_available = available;
    }
}

void SimulatedPlatform::set_apply_status(NativeModeRef mode, PlatformStatus status) {
    auto it = m_descriptors.find(mode);
    if (it != m_descriptors.end()) {
        it->second.apply_status = status;
    }
}

const SimulatedPlatform::DisplayEntry* SimulatedPlatform::find_display(DeviceId display) const {
    auto it = std::find_if(m_displays.begin(), m_displays.end(),
        [display](const DisplayEntry& e) { return e.display.id == display; });
    return it != m_displays.end() ? &*it : nullptr;
}

SimulatedPlatform::DisplayEntry* SimulatedPlatform::find_display(DeviceId display) {
    auto it = std::find_if(m_displays.begin(), m_displays.end(),
        [display](const DisplayEntry& e) { return e.display.id == display; });
    return it != m_displays.end() ? &*it : nullptr;
}

// =============================================================================
// Devices
// =============================================================================

PlatformStatus SimulatedPlatform::online_displays(std::vector<DeviceId>& out) {
    out.clear();
    if (m_enumeration_status != PlatformStatus::Success) {
        return m_enumeration_status;
    }
    for (const auto& entry : m_displays) {
        out.push_back(entry.display.id);
    }
    return PlatformStatus::Success;
}

bool SimulatedPlatform::is_main(DeviceId display) const {
    const auto* d = find_display(display);
    return d && d->display.main;
}

DeviceId SimulatedPlatform::mirrors(DeviceId display) const {
    const auto* d = find_display(display);
    return d ? d->display.mirror_of : k_null_device;
}

std::vector<std::string> SimulatedPlatform::product_names(DeviceId display) const {
    const auto* d = find_display(display);
    return d ? d->display.product_names : std::vector<std::string>{};
}

Rect SimulatedPlatform::bounds(DeviceId display) const {
    const auto* d = find_display(display);
    return d ? d->display.bounds : Rect{};
}

std::optional<Rect> SimulatedPlatform::visible_frame(DeviceId display) const {
    const auto* d = find_display(display);
    return d ? d->display.visible_frame : std::nullopt;
}

std::int32_t SimulatedPlatform::main_display_height() const {
    for (const auto& entry : m_displays) {
        if (entry.display.main) {
            return entry.display.bounds.h;
        }
    }
    return 0;
}

// =============================================================================
// Mode Descriptors
// =============================================================================

NativeModeRef SimulatedPlatform::copy_current_mode(DeviceId display) {
    auto* d = find_display(display);
    if (!d || !d->current_available || d->current == NativeModeRef::Null) {
        return NativeModeRef::Null;
    }
    retain_mode(d->current);
    return d->current;
}

std::vector<NativeModeRef> SimulatedPlatform::copy_all_modes(DeviceId display) {
    std::vector<NativeModeRef> result;
    auto* d = find_display(display);
    if (!d) {
        return result;
    }
    for (auto ref : d->listed) {
        retain_mode(ref);
        result.push_back(ref);
    }
    return result;
}

void SimulatedPlatform::retain_mode(NativeModeRef mode) {
    auto it = m_descriptors.find(mode);
    if (it != m_descriptors.end()) {
        ++it->second.references;
    }
}

void SimulatedPlatform::release_mode(NativeModeRef mode) {
    auto it = m_descriptors.find(mode);
    if (it == m_descriptors.end() || it->second.references == 0) {
        ++m_over_releases;
        vidmode_core::display_logger()->warn("Over-release of descriptor {}",
            static_cast<std::uintptr_t>(mode));
        return;
    }
    --it->second.references;
}

NativeModeInfo SimulatedPlatform::mode_info(NativeModeRef mode) const {
    auto it = m_descriptors.find(mode);
    return it != m_descriptors.end() ? it->second.info : NativeModeInfo{};
}

std::optional<RefreshPeriod> SimulatedPlatform::nominal_refresh_period(DeviceId display) const {
    const auto* d = find_display(display);
    return d ? d->display.refresh_period : std::nullopt;
}

// =============================================================================
// Capture and Switching
// =============================================================================

PlatformStatus SimulatedPlatform::capture_display(DeviceId display) {
    if (m_capture_status != PlatformStatus::Success) {
        return m_capture_status;
    }
    if (!find_display(display)) {
        return PlatformStatus::IllegalArgument;
    }
    ++m_capture_count;
    m_captured.insert(display);
    return PlatformStatus::Success;
}

PlatformStatus SimulatedPlatform::capture_all_displays() {
    if (m_capture_status != PlatformStatus::Success) {
        return m_capture_status;
    }
    ++m_capture_count;
    m_all_captured = true;
    return PlatformStatus::Success;
}

PlatformStatus SimulatedPlatform::release_display(DeviceId display) {
    ++m_release_count;
    m_captured.erase(display);
    return PlatformStatus::Success;
}

PlatformStatus SimulatedPlatform::release_all_displays() {
    ++m_release_count;
    m_all_captured = false;
    m_captured.clear();
    return PlatformStatus::Success;
}

PlatformStatus SimulatedPlatform::set_display_mode(DeviceId display, NativeModeRef mode) {
    m_apply_attempts.emplace_back(display, mode);

    auto* d = find_display(display);
    auto it = m_descriptors.find(mode);
    if (!d || it == m_descriptors.end() || it->second.owner != display) {
        return PlatformStatus::IllegalArgument;
    }
    if (it->second.apply_status != PlatformStatus::Success) {
        return it->second.apply_status;
    }

    d->current = mode;
    d->display.bounds.w = static_cast<std::int32_t>(it->second.info.width);
    d->display.bounds.h = static_cast<std::int32_t>(it->second.info.height);
    return PlatformStatus::Success;
}

// =============================================================================
// Fade
// =============================================================================

std::optional<FadeToken> SimulatedPlatform::acquire_fade_reservation(double seconds) {
    if (!m_fade_available || seconds <= 0.0) {
        return std::nullopt;
    }
    FadeToken token{m_next_fade_token++};
    m_fade_reservations.insert(token.value);
    return token;
}

PlatformStatus SimulatedPlatform::fade(FadeToken token, double seconds, FadeBlend from, FadeBlend to,
                                       bool synchronous) {
    if (m_fade_reservations.count(token.value) == 0) {
        return PlatformStatus::IllegalArgument;
    }
    m_fade_calls.push_back(FadeCall{seconds, from, to, synchronous});
    return PlatformStatus::Success;
}

void SimulatedPlatform::release_fade_reservation(FadeToken token) {
    m_fade_reservations.erase(token.value);
}

// =============================================================================
// Inspection
// =============================================================================

NativeModeRef SimulatedPlatform::current_mode(DeviceId display) const {
    const auto* d = find_display(display);
    return d ? d->current : NativeModeRef::Null;
}

std::uint32_t SimulatedPlatform::references(NativeModeRef mode) const {
    auto it = m_descriptors.find(mode);
    return it != m_descriptors.end() ? it->second.references : 0;
}

std::uint64_t SimulatedPlatform::outstanding_references() const {
    std::uint64_t total = 0;
    for (const auto& [ref, entry] : m_descriptors) {
        total += entry.references;
    }
    return total;
}

bool SimulatedPlatform::is_captured(DeviceId display) const {
    return m_all_captured || m_captured.count(display) > 0;
}

NativeModeRef SimulatedPlatform::descriptor(const std::string& name) const {
    auto it = m_descriptor_names.find(name);
    return it != m_descriptor_names.end() ? it->second : NativeModeRef::Null;
}

void SimulatedPlatform::reset_counters() {
    m_capture_count = 0;
    m_release_count = 0;
    m_over_releases = 0;
    m_apply_attempts.clear();
    m_fade_calls.clear();
}

// =============================================================================
// JSON Loading
// =============================================================================

namespace {

using PlatformResult = vidmode_core::Result<std::unique_ptr<SimulatedPlatform>>;

[[nodiscard]] const char* encoding_for_format(PixelFormat format) {
    switch (format) {
        case PixelFormat::Argb8888: return pixel_encoding::k_direct32;
        case PixelFormat::Argb1555: return pixel_encoding::k_direct16;
        case PixelFormat::Argb2101010: return pixel_encoding::k_direct30;
        default: return pixel_encoding::k_indexed8;
    }
}

[[nodiscard]] Rect rect_from_json(const nlohmann::json& j) {
    Rect rect;
    rect.x = j.at(0).get<std::int32_t>();
    rect.y = j.at(1).get<std::int32_t>();
    rect.w = j.at(2).get<std::int32_t>();
    rect.h = j.at(3).get<std::int32_t>();
    return rect;
}

[[nodiscard]] std::optional<PlatformStatus> status_field(const nlohmann::json& j, const char* key,
                                                         std::string& bad_value) {
    if (!j.contains(key)) {
        return PlatformStatus::Success;
    }
    std::string name = j[key].get<std::string>();
    auto status = parse_platform_status(name);
    if (!status) {
        bad_value = name;
    }
    return status;
}

} // anonymous namespace

PlatformResult SimulatedPlatform::from_json(const nlohmann::json& j) {
    auto platform = std::make_unique<SimulatedPlatform>();

    try {
        if (!j.is_object() || !j.contains("displays") || !j["displays"].is_array()) {
            return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                vidmode_core::ConfigError::parse_failed("platform description", "missing 'displays' array"));
        }

        std::string bad;
        auto enumeration = status_field(j, "enumeration_status", bad);
        if (!enumeration) {
            return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                vidmode_core::ConfigError::invalid_value("enumeration_status", bad));
        }
        platform->set_enumeration_status(*enumeration);

        auto capture = status_field(j, "capture_status", bad);
        if (!capture) {
            return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                vidmode_core::ConfigError::invalid_value("capture_status", bad));
        }
        platform->set_capture_status(*capture);

        platform->set_fade_available(j.value("fade_available", true));

        for (const auto& dj : j["displays"]) {
            SimulatedDisplay display;
            display.id = dj.at("id").get<DeviceId>();
            display.main = dj.value("main", false);
            display.mirror_of = dj.value("mirrors", k_null_device);
            if (dj.contains("names")) {
                display.product_names = dj["names"].get<std::vector<std::string>>();
            }
            if (dj.contains("bounds")) {
                display.bounds = rect_from_json(dj["bounds"]);
            }
            if (dj.contains("visible_frame")) {
                display.visible_frame = rect_from_json(dj["visible_frame"]);
            }
            if (dj.contains("refresh_period")) {
                const auto& pj = dj["refresh_period"];
                RefreshPeriod period;
                period.time_value = pj.value("value", std::int64_t{0});
                period.time_scale = pj.value("scale", std::int32_t{0});
                period.indefinite = pj.value("indefinite", false);
                display.refresh_period = period;
            }

            if (display.id == k_null_device) {
                return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                    vidmode_core::ConfigError::invalid_value("displays.id", "0"));
            }
            platform->add_display(display);
            platform->set_current_mode_available(display.id, dj.value("current_available", true));

            const nlohmann::json modes = dj.value("modes", nlohmann::json::array());
            for (const auto& mj : modes) {
                NativeModeInfo info;
                info.width = mj.at("width").get<std::uint32_t>();
                info.height = mj.at("height").get<std::uint32_t>();
                info.refresh_rate = mj.value("refresh_rate", 0.0);

                if (mj.contains("encoding")) {
                    info.pixel_encoding = mj["encoding"].get<std::string>();
                } else {
                    std::string format_name = mj.value("format", std::string("ARGB8888"));
                    auto format = parse_pixel_format(format_name);
                    // Unrecognized names become an unsupported encoding
                    info.pixel_encoding = format ? encoding_for_format(*format) : pixel_encoding::k_indexed8;
                }

                if (mj.contains("flags")) {
                    info.io_flags = 0;
                    for (const auto& flag : mj["flags"]) {
                        std::string name = flag.get<std::string>();
                        auto bit = parse_mode_flag(name);
                        if (!bit) {
                            return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                                vidmode_core::ConfigError::invalid_value("modes.flags", name));
                        }
                        info.io_flags |= *bit;
                    }
                } else {
                    info.io_flags = mode_flags::k_usable;
                }

                NativeModeRef ref = platform->add_descriptor(display.id, info, mj.value("listed", true));

                auto apply = status_field(mj, "apply_status", bad);
                if (!apply) {
                    return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                        vidmode_core::ConfigError::invalid_value("modes.apply_status", bad));
                }
                platform->set_apply_status(ref, *apply);

                if (mj.contains("name")) {
                    platform->m_descriptor_names[mj["name"].get<std::string>()] = ref;
                }
            }

            if (dj.contains("current")) {
                NativeModeRef current = platform->descriptor(dj["current"].get<std::string>());
                if (current == NativeModeRef::Null) {
                    return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
                        vidmode_core::ConfigError::invalid_value("displays.current",
                            dj["current"].get<std::string>()));
                }
                platform->set_current_mode(display.id, current);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
            vidmode_core::ConfigError::parse_failed("platform description", e.what()));
    }

    vidmode_core::display_logger()->debug("Simulated platform: {} displays, {} descriptors",
        platform->m_displays.size(), platform->m_descriptors.size());
    return vidmode_core::Ok(std::move(platform));
}

PlatformResult SimulatedPlatform::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
            vidmode_core::ConfigError::file_not_found(path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return vidmode_core::Err<std::unique_ptr<SimulatedPlatform>>(
            vidmode_core::ConfigError::parse_failed(path, e.what()));
    }

    return from_json(j);
}

} // namespace vidmode_display
