#include "udev_monitor.hpp"

#include <cstring>
#include <optional>
#include <util/logging.hpp>

extern "C" {
#include <libudev.h>
}

namespace kiln::session {

namespace {

auto is_card_node(udev_device* device) -> bool {
    const char* sysname = udev_device_get_sysname(device);
    return sysname && std::strncmp(sysname, "card", 4) == 0 &&
           std::strchr(sysname, '-') == nullptr;
}

auto parse_action(const char* action) -> std::optional<DeviceAction> {
    if (!action) {
        return std::nullopt;
    }
    if (std::strcmp(action, "add") == 0) {
        return DeviceAction::added;
    }
    if (std::strcmp(action, "change") == 0) {
        return DeviceAction::changed;
    }
    if (std::strcmp(action, "remove") == 0) {
        return DeviceAction::removed;
    }
    return std::nullopt;
}

auto device_seat(udev_device* device) -> std::string {
    const char* seat = udev_device_get_property_value(device, "ID_SEAT");
    return seat ? seat : "seat0";
}

auto is_boot_vga(udev_device* device) -> bool {
    udev_device* pci = udev_device_get_parent_with_subsystem_devtype(device, "pci", nullptr);
    if (!pci) {
        return false;
    }
    const char* boot_vga = udev_device_get_sysattr_value(pci, "boot_vga");
    return boot_vga && std::strcmp(boot_vga, "1") == 0;
}

} // namespace

void UdevMonitor::UdevDeleter::operator()(udev* ctx) const {
    udev_unref(ctx);
}

void UdevMonitor::MonitorDeleter::operator()(udev_monitor* monitor) const {
    udev_monitor_unref(monitor);
}

UdevMonitor::UdevMonitor(std::unique_ptr<udev, UdevDeleter> ctx,
                         std::unique_ptr<udev_monitor, MonitorDeleter> monitor)
    : m_udev(std::move(ctx)), m_monitor(std::move(monitor)) {}

auto UdevMonitor::create() -> Result<UdevMonitor> {
    std::unique_ptr<udev, UdevDeleter> ctx{udev_new()};
    if (!ctx) {
        return make_error<UdevMonitor>(ErrorCode::session_failed, "Failed to create udev context");
    }

    std::unique_ptr<udev_monitor, MonitorDeleter> monitor{
        udev_monitor_new_from_netlink(ctx.get(), "udev")};
    if (!monitor) {
        return make_error<UdevMonitor>(ErrorCode::session_failed,
                                       "Failed to create udev monitor");
    }
    if (udev_monitor_filter_add_match_subsystem_devtype(monitor.get(), "drm", nullptr) < 0 ||
        udev_monitor_enable_receiving(monitor.get()) < 0) {
        return make_error<UdevMonitor>(ErrorCode::session_failed,
                                       "Failed to enable udev monitor for drm");
    }

    return UdevMonitor{std::move(ctx), std::move(monitor)};
}

auto UdevMonitor::fd() const -> int {
    return udev_monitor_get_fd(m_monitor.get());
}

auto UdevMonitor::dispatch(std::vector<Event>& out) -> Result<void> {
    while (udev_device* device = udev_monitor_receive_device(m_monitor.get())) {
        auto action = parse_action(udev_device_get_action(device));
        const char* devnode = udev_device_get_devnode(device);
        if (action && devnode && is_card_node(device)) {
            out.push_back(DeviceEvent{
                .action = *action,
                .devnum = udev_device_get_devnum(device),
                .path = devnode,
            });
        }
        udev_device_unref(device);
    }
    return {};
}

auto find_primary_gpu(const std::string& seat_name) -> Result<std::filesystem::path> {
    udev* ctx = udev_new();
    if (!ctx) {
        return make_error<std::filesystem::path>(ErrorCode::device_open_failed,
                                                 "Failed to create udev context");
    }
    udev_enumerate* enumerate = udev_enumerate_new(ctx);
    if (!enumerate) {
        udev_unref(ctx);
        return make_error<std::filesystem::path>(ErrorCode::device_open_failed,
                                                 "Failed to create udev enumerator");
    }
    udev_enumerate_add_match_subsystem(enumerate, "drm");
    udev_enumerate_add_match_sysname(enumerate, "card[0-9]*");
    udev_enumerate_scan_devices(enumerate);

    std::optional<std::filesystem::path> first;
    std::optional<std::filesystem::path> boot_vga;

    udev_list_entry* entry = nullptr;
    udev_list_entry_foreach(entry, udev_enumerate_get_list_entry(enumerate)) {
        udev_device* device =
            udev_device_new_from_syspath(ctx, udev_list_entry_get_name(entry));
        if (!device) {
            continue;
        }
        const char* devnode = udev_device_get_devnode(device);
        if (devnode && is_card_node(device) && device_seat(device) == seat_name) {
            if (!first) {
                first = devnode;
            }
            if (!boot_vga && is_boot_vga(device)) {
                boot_vga = devnode;
            }
        }
        udev_device_unref(device);
    }

    udev_enumerate_unref(enumerate);
    udev_unref(ctx);

    if (boot_vga) {
        KILN_LOG_DEBUG("Primary GPU (boot VGA): {}", boot_vga->string());
        return *boot_vga;
    }
    if (first) {
        KILN_LOG_DEBUG("Primary GPU: {}", first->string());
        return *first;
    }
    return make_error<std::filesystem::path>(ErrorCode::device_open_failed,
                                             "No DRM card found on " + seat_name);
}

} // namespace kiln::session
