#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <sys/types.h>
#include <util/error.hpp>
#include <vector>

extern "C" {
struct udev;         // NOLINT(readability-identifier-naming)
struct udev_monitor; // NOLINT(readability-identifier-naming)
}

namespace kiln::session {

enum class DeviceAction : uint8_t { added, changed, removed };

[[nodiscard]] constexpr auto to_string(DeviceAction action) -> const char* {
    switch (action) {
    case DeviceAction::added:
        return "added";
    case DeviceAction::changed:
        return "changed";
    case DeviceAction::removed:
        return "removed";
    }
    return "unknown";
}

struct DeviceEvent {
    DeviceAction action = DeviceAction::changed;
    dev_t devnum = 0;
    std::filesystem::path path;
};

/// @brief udev netlink monitor for DRM card nodes. Usable directly as a reactor source.
class UdevMonitor {
public:
    using Event = DeviceEvent;

    [[nodiscard]] static auto create() -> Result<UdevMonitor>;

    [[nodiscard]] auto fd() const -> int;
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void>;

private:
    struct UdevDeleter {
        void operator()(udev* ctx) const;
    };
    struct MonitorDeleter {
        void operator()(udev_monitor* monitor) const;
    };

    UdevMonitor(std::unique_ptr<udev, UdevDeleter> ctx,
                std::unique_ptr<udev_monitor, MonitorDeleter> monitor);

    std::unique_ptr<udev, UdevDeleter> m_udev;
    std::unique_ptr<udev_monitor, MonitorDeleter> m_monitor;
};

/// @brief Picks the DRM card node to drive on @p seat_name.
///
/// Cards assigned to other seats are skipped. Among the rest, the one whose PCI parent was the
/// boot VGA device wins; otherwise the first card found.
[[nodiscard]] auto find_primary_gpu(const std::string& seat_name) -> Result<std::filesystem::path>;

} // namespace kiln::session
