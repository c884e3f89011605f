#pragma once

#include <cstdint>
#include <drm_fourcc.h>
#include <string>
#include <vulkan/vulkan.hpp>

namespace kiln::util {

[[nodiscard]] inline vk::Format drm_to_vk_format(uint32_t drm_format) {
    switch (drm_format) {
    case DRM_FORMAT_ARGB8888:
    case DRM_FORMAT_XRGB8888:
        return vk::Format::eB8G8R8A8Unorm;
    case DRM_FORMAT_ABGR8888:
    case DRM_FORMAT_XBGR8888:
        return vk::Format::eR8G8B8A8Unorm;
    case DRM_FORMAT_ARGB2101010:
    case DRM_FORMAT_XRGB2101010:
        return vk::Format::eA2R10G10B10UnormPack32;
    case DRM_FORMAT_ABGR2101010:
    case DRM_FORMAT_XBGR2101010:
        return vk::Format::eA2B10G10R10UnormPack32;
    case DRM_FORMAT_RGB565:
        return vk::Format::eR5G6B5UnormPack16;
    default:
        return vk::Format::eUndefined;
    }
}

/// @brief Renders a fourcc as its four printable characters, e.g. "AB24".
[[nodiscard]] inline std::string drm_format_name(uint32_t drm_format) {
    std::string name(4, '?');
    for (size_t i = 0; i < name.size(); ++i) {
        auto c = static_cast<char>((drm_format >> (8 * i)) & 0xFF);
        if (c >= 0x20 && c < 0x7F) {
            name[i] = c;
        }
    }
    return name;
}

} // namespace kiln::util
