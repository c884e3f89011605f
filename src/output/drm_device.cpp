#include "drm_device.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <drm_fourcc.h>
#include <gbm.h>
#include <map>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <util/drm_format.hpp>
#include <util/logging.hpp>
#include <util/profiling.hpp>
#include <vector>
#include <xf86drm.h>
#include <xf86drmMode.h>

namespace kiln::output {

namespace {

// Scanout formats in preference order. Both are linear-renderable on every driver we target.
constexpr std::array SCANOUT_FORMATS = {DRM_FORMAT_ABGR8888, DRM_FORMAT_XRGB8888};

constexpr uint64_t PLANE_TYPE_PRIMARY = 1;

constexpr size_t MAX_OUTSTANDING_COMMITS = 8;

template <auto Free>
struct DrmDeleter {
    template <typename T>
    void operator()(T* ptr) const {
        if (ptr) {
            Free(ptr);
        }
    }
};

using UniqueResources = std::unique_ptr<drmModeRes, DrmDeleter<drmModeFreeResources>>;
using UniqueConnector = std::unique_ptr<drmModeConnector, DrmDeleter<drmModeFreeConnector>>;
using UniqueEncoder = std::unique_ptr<drmModeEncoder, DrmDeleter<drmModeFreeEncoder>>;
using UniquePlaneResources =
    std::unique_ptr<drmModePlaneRes, DrmDeleter<drmModeFreePlaneResources>>;
using UniquePlane = std::unique_ptr<drmModePlane, DrmDeleter<drmModeFreePlane>>;
using UniqueObjectProperties =
    std::unique_ptr<drmModeObjectProperties, DrmDeleter<drmModeFreeObjectProperties>>;
using UniqueProperty = std::unique_ptr<drmModePropertyRes, DrmDeleter<drmModeFreeProperty>>;
using UniqueAtomicReq = std::unique_ptr<drmModeAtomicReq, DrmDeleter<drmModeAtomicFree>>;

struct ConnectorProps {
    uint32_t crtc_id = 0;
};

struct CrtcProps {
    uint32_t mode_id = 0;
    uint32_t active = 0;
};

struct PlaneProps {
    uint32_t fb_id = 0;
    uint32_t crtc_id = 0;
    uint32_t src_x = 0;
    uint32_t src_y = 0;
    uint32_t src_w = 0;
    uint32_t src_h = 0;
    uint32_t crtc_x = 0;
    uint32_t crtc_y = 0;
    uint32_t crtc_w = 0;
    uint32_t crtc_h = 0;
    uint32_t fb_damage_clips = 0;
};

auto get_prop_id(int fd, uint32_t object_id, uint32_t object_type, const char* name) -> uint32_t {
    UniqueObjectProperties props{drmModeObjectGetProperties(fd, object_id, object_type)};
    if (!props) {
        return 0;
    }
    for (uint32_t i = 0; i < props->count_props; ++i) {
        UniqueProperty prop{drmModeGetProperty(fd, props->props[i])};
        if (prop && std::strcmp(prop->name, name) == 0) {
            return prop->prop_id;
        }
    }
    return 0;
}

auto get_prop_value(int fd, uint32_t object_id, uint32_t object_type, uint32_t prop_id)
    -> std::optional<uint64_t> {
    UniqueObjectProperties props{drmModeObjectGetProperties(fd, object_id, object_type)};
    if (!props) {
        return std::nullopt;
    }
    for (uint32_t i = 0; i < props->count_props; ++i) {
        if (props->props[i] == prop_id) {
            return props->prop_values[i];
        }
    }
    return std::nullopt;
}

auto refresh_mhz(const drmModeModeInfo& mode) -> uint32_t {
    if (mode.htotal == 0 || mode.vtotal == 0) {
        return 0;
    }
    uint64_t refresh = (static_cast<uint64_t>(mode.clock) * 1000000ULL / mode.htotal +
                        mode.vtotal / 2) /
                       mode.vtotal;
    if ((mode.flags & DRM_MODE_FLAG_INTERLACE) != 0) {
        refresh *= 2;
    }
    if ((mode.flags & DRM_MODE_FLAG_DBLSCAN) != 0) {
        refresh /= 2;
    }
    if (mode.vscan > 1) {
        refresh /= mode.vscan;
    }
    return static_cast<uint32_t>(refresh);
}

auto connector_name(const drmModeConnector& connector) -> std::string {
    const char* type = drmModeGetConnectorTypeName(connector.connector_type);
    return std::string(type ? type : "Unknown") + "-" + std::to_string(connector.connector_type_id);
}

auto plane_supports_format(const drmModePlane& plane, uint32_t format) -> bool {
    for (uint32_t i = 0; i < plane.count_formats; ++i) {
        if (plane.formats[i] == format) {
            return true;
        }
    }
    return false;
}

auto errno_message(const char* what) -> std::string {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

struct DrmDevice::Impl {
    struct ScanoutBuffer {
        gbm_bo* bo = nullptr;
        uint32_t fb_id = 0;
        util::ExternalImage image;
    };

    int fd = -1;
    gbm_device* gbm = nullptr;

    uint32_t connector_id = 0;
    uint32_t crtc_id = 0;
    uint32_t crtc_index = 0;
    uint32_t plane_id = 0;
    uint32_t format = 0;
    drmModeModeInfo mode{};
    uint32_t mode_blob = 0;

    ConnectorProps connector_props;
    CrtcProps crtc_props;
    PlaneProps plane_props;

    OutputDescriptor descriptor;
    std::vector<ScanoutBuffer> buffers;
    bool damage_tracking = true;
    bool modeset_pending = true;

    // Commits whose page-flip event has not been read yet. A commit issued before a session
    // pause may stay here until its event shows up after resume, or forever.
    std::map<CommitId, SlotId> outstanding;
    CommitId next_commit = 1;
    std::vector<CompletionEvent> completed;

    // Set for the duration of drmHandleEvent; page-flip user data only carries the commit id.
    static inline thread_local Impl* dispatching = nullptr;

    ~Impl();

    [[nodiscard]] auto bind_connector() -> Result<void>;
    [[nodiscard]] auto bind_crtc(const drmModeConnector& connector, const drmModeRes& resources)
        -> Result<void>;
    [[nodiscard]] auto bind_plane() -> Result<void>;
    [[nodiscard]] auto lookup_properties() -> Result<void>;
    [[nodiscard]] auto allocate_buffers(uint32_t count) -> Result<void>;
    [[nodiscard]] auto add_damage(drmModeAtomicReq* req, const DamageRegion& damage)
        -> Result<uint32_t>;

    static void handle_page_flip(int fd, unsigned int sequence, unsigned int tv_sec,
                                 unsigned int tv_usec, unsigned int crtc_id, void* user_data);
};

DrmDevice::Impl::~Impl() {
    for (auto& buffer : buffers) {
        if (buffer.fb_id != 0) {
            drmModeRmFB(fd, buffer.fb_id);
        }
        if (buffer.bo) {
            gbm_bo_destroy(buffer.bo);
        }
    }
    buffers.clear();
    if (mode_blob != 0) {
        drmModeDestroyPropertyBlob(fd, mode_blob);
    }
    if (gbm) {
        gbm_device_destroy(gbm);
    }
}

auto DrmDevice::Impl::bind_connector() -> Result<void> {
    UniqueResources resources{drmModeGetResources(fd)};
    if (!resources) {
        return make_error<void>(ErrorCode::drm_setup_failed,
                                errno_message("drmModeGetResources failed"));
    }

    for (int i = 0; i < resources->count_connectors; ++i) {
        UniqueConnector connector{drmModeGetConnector(fd, resources->connectors[i])};
        if (!connector) {
            continue;
        }
        if (connector->connection != DRM_MODE_CONNECTED || connector->count_modes <= 0) {
            KILN_LOG_DEBUG("Skipping connector {} (not connected or no modes)",
                           connector_name(*connector));
            continue;
        }

        mode = connector->modes[0];
        for (int m = 0; m < connector->count_modes; ++m) {
            if ((connector->modes[m].type & DRM_MODE_TYPE_PREFERRED) != 0) {
                mode = connector->modes[m];
                break;
            }
        }

        auto crtc = bind_crtc(*connector, *resources);
        if (!crtc) {
            KILN_LOG_DEBUG("Skipping connector {}: {}", connector_name(*connector),
                           crtc.error().message);
            continue;
        }

        connector_id = connector->connector_id;
        descriptor.name = connector_name(*connector);
        descriptor.mode = OutputMode{
            .width = mode.hdisplay,
            .height = mode.vdisplay,
            .refresh_mhz = refresh_mhz(mode),
        };
        descriptor.physical_width_mm = connector->mmWidth;
        descriptor.physical_height_mm = connector->mmHeight;
        return {};
    }

    return make_error<void>(ErrorCode::drm_setup_failed,
                            "No connected connector with a usable mode and CRTC");
}

auto DrmDevice::Impl::bind_crtc(const drmModeConnector& connector, const drmModeRes& resources)
    -> Result<void> {
    for (int e = 0; e < connector.count_encoders; ++e) {
        UniqueEncoder encoder{drmModeGetEncoder(fd, connector.encoders[e])};
        if (!encoder) {
            continue;
        }
        for (int c = 0; c < resources.count_crtcs; ++c) {
            if ((encoder->possible_crtcs & (1U << static_cast<uint32_t>(c))) != 0) {
                crtc_id = resources.crtcs[c];
                crtc_index = static_cast<uint32_t>(c);
                return {};
            }
        }
    }
    return make_error<void>(ErrorCode::drm_setup_failed, "No CRTC reachable from encoders");
}

auto DrmDevice::Impl::bind_plane() -> Result<void> {
    UniquePlaneResources planes{drmModeGetPlaneResources(fd)};
    if (!planes) {
        return make_error<void>(ErrorCode::drm_setup_failed,
                                errno_message("drmModeGetPlaneResources failed"));
    }

    for (uint32_t i = 0; i < planes->count_planes; ++i) {
        UniquePlane plane{drmModeGetPlane(fd, planes->planes[i])};
        if (!plane || (plane->possible_crtcs & (1U << crtc_index)) == 0) {
            continue;
        }
        uint32_t type_prop = get_prop_id(fd, plane->plane_id, DRM_MODE_OBJECT_PLANE, "type");
        auto type = get_prop_value(fd, plane->plane_id, DRM_MODE_OBJECT_PLANE, type_prop);
        if (type_prop == 0 || type != PLANE_TYPE_PRIMARY) {
            continue;
        }
        for (uint32_t candidate : SCANOUT_FORMATS) {
            if (plane_supports_format(*plane, candidate)) {
                plane_id = plane->plane_id;
                format = candidate;
                return {};
            }
        }
        return make_error<void>(ErrorCode::drm_setup_failed,
                                "Primary plane " + std::to_string(plane->plane_id) +
                                    " supports neither ABGR8888 nor XRGB8888");
    }

    return make_error<void>(ErrorCode::drm_setup_failed,
                            "No primary plane for CRTC " + std::to_string(crtc_id));
}

auto DrmDevice::Impl::lookup_properties() -> Result<void> {
    connector_props.crtc_id = get_prop_id(fd, connector_id, DRM_MODE_OBJECT_CONNECTOR, "CRTC_ID");
    crtc_props.mode_id = get_prop_id(fd, crtc_id, DRM_MODE_OBJECT_CRTC, "MODE_ID");
    crtc_props.active = get_prop_id(fd, crtc_id, DRM_MODE_OBJECT_CRTC, "ACTIVE");

    auto plane_prop = [this](const char* name) {
        return get_prop_id(fd, plane_id, DRM_MODE_OBJECT_PLANE, name);
    };
    plane_props.fb_id = plane_prop("FB_ID");
    plane_props.crtc_id = plane_prop("CRTC_ID");
    plane_props.src_x = plane_prop("SRC_X");
    plane_props.src_y = plane_prop("SRC_Y");
    plane_props.src_w = plane_prop("SRC_W");
    plane_props.src_h = plane_prop("SRC_H");
    plane_props.crtc_x = plane_prop("CRTC_X");
    plane_props.crtc_y = plane_prop("CRTC_Y");
    plane_props.crtc_w = plane_prop("CRTC_W");
    plane_props.crtc_h = plane_prop("CRTC_H");
    plane_props.fb_damage_clips = plane_prop("FB_DAMAGE_CLIPS");

    const std::array required = {
        connector_props.crtc_id, crtc_props.mode_id, crtc_props.active,
        plane_props.fb_id,       plane_props.crtc_id, plane_props.src_x,
        plane_props.src_y,       plane_props.src_w,   plane_props.src_h,
        plane_props.crtc_x,      plane_props.crtc_y,  plane_props.crtc_w,
        plane_props.crtc_h,
    };
    for (uint32_t id : required) {
        if (id == 0) {
            return make_error<void>(ErrorCode::drm_setup_failed,
                                    "Driver is missing a required atomic property");
        }
    }

    if (drmModeCreatePropertyBlob(fd, &mode, sizeof(mode), &mode_blob) != 0) {
        return make_error<void>(ErrorCode::drm_setup_failed,
                                errno_message("Failed to create mode blob"));
    }
    return {};
}

auto DrmDevice::Impl::allocate_buffers(uint32_t count) -> Result<void> {
    gbm = gbm_create_device(fd);
    if (!gbm) {
        return make_error<void>(ErrorCode::gbm_alloc_failed, "gbm_create_device failed");
    }

    buffers.resize(count);
    for (uint32_t slot = 0; slot < count; ++slot) {
        auto& buffer = buffers[slot];
        buffer.bo = gbm_bo_create(gbm, mode.hdisplay, mode.vdisplay, format,
                                  GBM_BO_USE_SCANOUT | GBM_BO_USE_RENDERING | GBM_BO_USE_LINEAR);
        if (!buffer.bo) {
            return make_error<void>(ErrorCode::gbm_alloc_failed,
                                    errno_message("gbm_bo_create failed"));
        }

        std::array<uint32_t, 4> handles{gbm_bo_get_handle(buffer.bo).u32, 0, 0, 0};
        std::array<uint32_t, 4> pitches{gbm_bo_get_stride(buffer.bo), 0, 0, 0};
        std::array<uint32_t, 4> offsets{gbm_bo_get_offset(buffer.bo, 0), 0, 0, 0};
        std::array<uint64_t, 4> modifiers{DRM_FORMAT_MOD_LINEAR, 0, 0, 0};

        if (drmModeAddFB2WithModifiers(fd, mode.hdisplay, mode.vdisplay, format, handles.data(),
                                       pitches.data(), offsets.data(), modifiers.data(),
                                       &buffer.fb_id, DRM_MODE_FB_MODIFIERS) != 0) {
            return make_error<void>(ErrorCode::gbm_alloc_failed,
                                    errno_message("drmModeAddFB2WithModifiers failed"));
        }

        int dmabuf = gbm_bo_get_fd(buffer.bo);
        if (dmabuf < 0) {
            return make_error<void>(ErrorCode::gbm_alloc_failed,
                                    "gbm_bo_get_fd failed for slot " + std::to_string(slot));
        }

        buffer.image.width = mode.hdisplay;
        buffer.image.height = mode.vdisplay;
        buffer.image.stride = pitches[0];
        buffer.image.offset = offsets[0];
        buffer.image.drm_format = format;
        buffer.image.modifier = DRM_FORMAT_MOD_LINEAR;
        buffer.image.handle = util::UniqueFd{dmabuf};
    }

    KILN_LOG_INFO("Allocated {} scanout buffers {}x{} {}", count, mode.hdisplay, mode.vdisplay,
                  util::drm_format_name(format));
    return {};
}

auto DrmDevice::Impl::add_damage(drmModeAtomicReq* req, const DamageRegion& damage)
    -> Result<uint32_t> {
    if (!damage_tracking || plane_props.fb_damage_clips == 0 || damage.empty()) {
        return 0U;
    }

    std::vector<drm_mode_rect> rects;
    rects.reserve(damage.size());
    for (const auto& rect : damage) {
        rects.push_back(drm_mode_rect{
            .x1 = rect.x,
            .y1 = rect.y,
            .x2 = rect.x + rect.width,
            .y2 = rect.y + rect.height,
        });
    }

    uint32_t blob = 0;
    if (drmModeCreatePropertyBlob(fd, rects.data(), rects.size() * sizeof(drm_mode_rect),
                                  &blob) != 0) {
        return make_error<uint32_t>(ErrorCode::commit_rejected,
                                    errno_message("Failed to create damage blob"));
    }
    if (drmModeAtomicAddProperty(req, plane_id, plane_props.fb_damage_clips, blob) < 0) {
        drmModeDestroyPropertyBlob(fd, blob);
        return make_error<uint32_t>(ErrorCode::commit_rejected, "Failed to add damage clips");
    }
    return blob;
}

void DrmDevice::Impl::handle_page_flip(int /*fd*/, unsigned int sequence, unsigned int tv_sec,
                                       unsigned int tv_usec, unsigned int crtc_id,
                                       void* user_data) {
    Impl* impl = dispatching;
    auto commit = static_cast<CommitId>(reinterpret_cast<uintptr_t>(user_data));
    auto it = impl->outstanding.find(commit);
    if (it == impl->outstanding.end()) {
        KILN_LOG_DEBUG("Page flip for unknown commit {} on crtc {}", commit, crtc_id);
        return;
    }
    SlotId slot = it->second;
    impl->outstanding.erase(it);
    impl->completed.push_back(CompletionEvent{
        .slot = slot,
        .commit = commit,
        .crtc_id = crtc_id,
        .sequence = sequence,
        .timestamp = std::chrono::seconds(tv_sec) + std::chrono::microseconds(tv_usec),
    });
}

DrmDevice::DrmDevice() : m_impl(std::make_unique<Impl>()) {}

DrmDevice::~DrmDevice() = default;

auto DrmDevice::create(int drm_fd, const DrmSettings& settings) -> ResultPtr<DrmDevice> {
    KILN_PROFILE_FUNCTION();
    auto device = std::unique_ptr<DrmDevice>(new DrmDevice());
    auto& impl = *device->m_impl;
    impl.fd = drm_fd;
    impl.damage_tracking = settings.damage_tracking;

    if (drmSetClientCap(drm_fd, DRM_CLIENT_CAP_UNIVERSAL_PLANES, 1) != 0 ||
        drmSetClientCap(drm_fd, DRM_CLIENT_CAP_ATOMIC, 1) != 0) {
        return make_result_ptr_error<DrmDevice>(ErrorCode::drm_setup_failed,
                                                "Atomic modesetting is not supported");
    }

    auto setup = [&impl, &settings]() -> Result<void> {
        KILN_TRY(impl.bind_connector());
        KILN_TRY(impl.bind_plane());
        KILN_TRY(impl.lookup_properties());
        KILN_TRY(impl.allocate_buffers(settings.slot_count));
        return {};
    }();
    if (!setup) {
        return nonstd::make_unexpected(setup.error());
    }

    struct stat st {};
    if (fstat(drm_fd, &st) == 0) {
        impl.descriptor.device = st.st_rdev;
    }
    impl.descriptor.transform = settings.transform;

    KILN_LOG_INFO("Output {}: {}x{}@{}.{:03}Hz, connector {}, crtc {}, plane {}",
                  impl.descriptor.name, impl.mode.hdisplay, impl.mode.vdisplay,
                  impl.descriptor.mode.refresh_mhz / 1000, impl.descriptor.mode.refresh_mhz % 1000,
                  impl.connector_id, impl.crtc_id, impl.plane_id);
    if (impl.plane_props.fb_damage_clips == 0) {
        KILN_LOG_DEBUG("Plane {} has no FB_DAMAGE_CLIPS; damage is not forwarded", impl.plane_id);
    }
    return make_result_ptr(std::move(device));
}

auto DrmDevice::descriptor() const -> const OutputDescriptor& {
    return m_impl->descriptor;
}

auto DrmDevice::slot_count() const -> uint32_t {
    return static_cast<uint32_t>(m_impl->buffers.size());
}

auto DrmDevice::buffer(SlotId slot) const -> const util::ExternalImage& {
    return m_impl->buffers.at(slot).image;
}

auto DrmDevice::commit(SlotId slot, const DamageRegion& damage) -> Result<CommitId> {
    KILN_PROFILE_FUNCTION();
    auto& impl = *m_impl;
    if (slot >= impl.buffers.size()) {
        return make_error<CommitId>(ErrorCode::commit_rejected,
                                    "Slot " + std::to_string(slot) + " has no buffer");
    }
    const auto& buffer = impl.buffers[slot];

    UniqueAtomicReq req{drmModeAtomicAlloc()};
    if (!req) {
        return make_error<CommitId>(ErrorCode::commit_rejected, "drmModeAtomicAlloc failed");
    }

    uint32_t flags = DRM_MODE_PAGE_FLIP_EVENT | DRM_MODE_ATOMIC_NONBLOCK;
    int ret = 0;
    if (impl.modeset_pending) {
        flags |= DRM_MODE_ATOMIC_ALLOW_MODESET;
        ret |= drmModeAtomicAddProperty(req.get(), impl.connector_id,
                                        impl.connector_props.crtc_id, impl.crtc_id);
        ret |= drmModeAtomicAddProperty(req.get(), impl.crtc_id, impl.crtc_props.mode_id,
                                        impl.mode_blob);
        ret |= drmModeAtomicAddProperty(req.get(), impl.crtc_id, impl.crtc_props.active, 1);
    }

    const auto& props = impl.plane_props;
    const uint64_t width = impl.mode.hdisplay;
    const uint64_t height = impl.mode.vdisplay;
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.fb_id, buffer.fb_id);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.crtc_id, impl.crtc_id);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.src_x, 0);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.src_y, 0);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.src_w, width << 16);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.src_h, height << 16);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.crtc_x, 0);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.crtc_y, 0);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.crtc_w, width);
    ret |= drmModeAtomicAddProperty(req.get(), impl.plane_id, props.crtc_h, height);
    if (ret < 0) {
        return make_error<CommitId>(ErrorCode::commit_rejected,
                                    "Failed to build atomic request for slot " +
                                        std::to_string(slot));
    }

    uint32_t damage_blob = KILN_TRY(impl.add_damage(req.get(), damage));

    const CommitId commit = impl.next_commit++;
    int commit_result = drmModeAtomicCommit(impl.fd, req.get(), flags,
                                            reinterpret_cast<void*>(static_cast<uintptr_t>(commit)));
    int commit_errno = errno;
    if (damage_blob != 0) {
        drmModeDestroyPropertyBlob(impl.fd, damage_blob);
    }
    if (commit_result != 0) {
        return make_error<CommitId>(ErrorCode::commit_rejected,
                                    std::string("Atomic commit") +
                                        (impl.modeset_pending ? " (modeset)" : "") +
                                        " failed: " + std::strerror(commit_errno));
    }

    if (impl.modeset_pending) {
        KILN_LOG_DEBUG("Modeset committed on {}", impl.descriptor.name);
        impl.modeset_pending = false;
    }
    // Events lost across a VT switch never arrive; keep only the last few commits.
    while (impl.outstanding.size() >= MAX_OUTSTANDING_COMMITS) {
        impl.outstanding.erase(impl.outstanding.begin());
    }
    impl.outstanding.emplace(commit, slot);
    return commit;
}

void DrmDevice::request_modeset() {
    m_impl->modeset_pending = true;
}

auto DrmDevice::event_fd() const -> int {
    return m_impl->fd;
}

auto DrmDevice::read_completions(std::vector<CompletionEvent>& out) -> Result<void> {
    drmEventContext context{};
    context.version = 3;
    context.page_flip_handler2 = &Impl::handle_page_flip;

    m_impl->completed.clear();
    Impl::dispatching = m_impl.get();
    int handled = drmHandleEvent(m_impl->fd, &context);
    Impl::dispatching = nullptr;
    if (handled != 0) {
        return make_error<void>(ErrorCode::invalid_data, errno_message("drmHandleEvent failed"));
    }
    for (auto& event : m_impl->completed) {
        out.push_back(event);
    }
    m_impl->completed.clear();
    return {};
}

} // namespace kiln::output
