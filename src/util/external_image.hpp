#pragma once

#include <cstdint>
#include <util/unique_fd.hpp>

namespace kiln::util {

/// @brief Single-plane dmabuf exported by the buffer allocator.
///
/// The descriptor owns its fd. Importers duplicate it; the allocator keeps the original until
/// the buffer is destroyed.
struct ExternalImage {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t stride = 0;
    uint32_t offset = 0;
    uint32_t drm_format = 0;
    uint64_t modifier = 0;
    util::UniqueFd handle;
};

} // namespace kiln::util
