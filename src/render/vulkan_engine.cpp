#include "vulkan_engine.hpp"

#include "vulkan_error.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstring>
#include <sys/sysmacros.h>
#include <unistd.h>
#include <util/drm_format.hpp>
#include <util/logging.hpp>
#include <util/profiling.hpp>
#include <vector>
#include <xkbcommon/xkbcommon-keysyms.h>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace kiln::render {

namespace {

constexpr std::array REQUIRED_INSTANCE_EXTENSIONS = {
    VK_KHR_EXTERNAL_MEMORY_CAPABILITIES_EXTENSION_NAME,
    VK_KHR_GET_PHYSICAL_DEVICE_PROPERTIES_2_EXTENSION_NAME,
};

constexpr const char* VALIDATION_LAYER_NAME = "VK_LAYER_KHRONOS_validation";

constexpr std::array REQUIRED_DEVICE_EXTENSIONS = {
    VK_KHR_EXTERNAL_MEMORY_EXTENSION_NAME,
    VK_KHR_EXTERNAL_MEMORY_FD_EXTENSION_NAME,
    VK_EXT_EXTERNAL_MEMORY_DMA_BUF_EXTENSION_NAME,
};

constexpr uint64_t FENCE_TIMEOUT_NS = 1'000'000'000;

auto has_extension(const std::vector<vk::ExtensionProperties>& available, const char* name)
    -> bool {
    return std::any_of(available.begin(), available.end(), [name](const auto& ext) {
        return std::strcmp(ext.extensionName, name) == 0;
    });
}

// Hue rotation over roughly ten seconds, full saturation.
auto animated_color(float seconds) -> std::array<float, 4> {
    float hue = std::fmod(seconds * 36.0F, 360.0F) / 60.0F;
    float x = 1.0F - std::fabs(std::fmod(hue, 2.0F) - 1.0F);
    std::array<float, 4> rgba{0.0F, 0.0F, 0.0F, 1.0F};
    switch (static_cast<int>(hue)) {
    case 0:
        rgba = {1.0F, x, 0.0F, 1.0F};
        break;
    case 1:
        rgba = {x, 1.0F, 0.0F, 1.0F};
        break;
    case 2:
        rgba = {0.0F, 1.0F, x, 1.0F};
        break;
    case 3:
        rgba = {0.0F, x, 1.0F, 1.0F};
        break;
    case 4:
        rgba = {x, 0.0F, 1.0F, 1.0F};
        break;
    default:
        rgba = {1.0F, 0.0F, x, 1.0F};
        break;
    }
    return rgba;
}

} // namespace

struct VulkanEngine::Impl {
    struct ImportedImage {
        uint64_t id = 0;
        int source_fd = -1;
        uint32_t width = 0;
        uint32_t height = 0;
        uint32_t drm_format = 0;
        vk::Image image;
        vk::DeviceMemory memory;
    };

    vk::UniqueInstance instance;
    vk::PhysicalDevice physical_device;
    uint32_t queue_family = UINT32_MAX;
    vk::UniqueDevice device;
    vk::Queue queue;
    vk::UniqueCommandPool command_pool;
    vk::CommandBuffer command_buffer;
    vk::UniqueFence fence;

    std::vector<ImportedImage> imports;
    const ImportedImage* attached = nullptr;
    uint64_t next_import_id = 1;

    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    float paused_at = -1.0F;
    uint64_t frames = 0;
    // Set once the GPU may still own the command buffer; nothing is recorded after that.
    bool lost = false;

    ~Impl();

    [[nodiscard]] auto create_instance(bool enable_validation) -> Result<void>;
    [[nodiscard]] auto select_physical_device(dev_t drm_device) -> Result<void>;
    [[nodiscard]] auto create_device() -> Result<void>;
    [[nodiscard]] auto create_command_resources() -> Result<void>;
    [[nodiscard]] auto import_dmabuf(const util::ExternalImage& image) -> Result<ImportedImage>;
    [[nodiscard]] auto record_frame(const ImportedImage& target, std::array<float, 4> color)
        -> Result<void>;
    [[nodiscard]] auto submit_and_wait() -> Result<void>;
    void handle_keys(runtime::AppChannel& channel);
    [[nodiscard]] auto animation_time() const -> float;
    void destroy_import(ImportedImage& imported);
};

VulkanEngine::Impl::~Impl() {
    if (device) {
        auto wait_result = device->waitIdle();
        if (wait_result != vk::Result::eSuccess) {
            KILN_LOG_WARN("waitIdle failed during shutdown: {}", vk::to_string(wait_result));
        }
        for (auto& imported : imports) {
            destroy_import(imported);
        }
    }
    imports.clear();
}

void VulkanEngine::Impl::destroy_import(ImportedImage& imported) {
    if (imported.image) {
        device->destroyImage(imported.image);
        imported.image = nullptr;
    }
    if (imported.memory) {
        device->freeMemory(imported.memory);
        imported.memory = nullptr;
    }
}

auto VulkanEngine::Impl::create_instance(bool enable_validation) -> Result<void> {
    std::vector<const char*> extensions(REQUIRED_INSTANCE_EXTENSIONS.begin(),
                                        REQUIRED_INSTANCE_EXTENSIONS.end());
    std::vector<const char*> layers;

    if (enable_validation) {
        auto [layer_result, available] = vk::enumerateInstanceLayerProperties();
        bool found = layer_result == vk::Result::eSuccess &&
                     std::any_of(available.begin(), available.end(), [](const auto& layer) {
                         return std::strcmp(layer.layerName, VALIDATION_LAYER_NAME) == 0;
                     });
        if (found) {
            layers.push_back(VALIDATION_LAYER_NAME);
            KILN_LOG_INFO("Vulkan validation layer enabled");
        } else {
            KILN_LOG_WARN("Vulkan validation layer requested but not available");
        }
    }

    vk::ApplicationInfo app_info{};
    app_info.pApplicationName = "kiln";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName = "kiln";
    app_info.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion = VK_API_VERSION_1_1;

    vk::InstanceCreateInfo create_info{};
    create_info.pApplicationInfo = &app_info;
    create_info.enabledExtensionCount = static_cast<uint32_t>(extensions.size());
    create_info.ppEnabledExtensionNames = extensions.data();
    create_info.enabledLayerCount = static_cast<uint32_t>(layers.size());
    create_info.ppEnabledLayerNames = layers.data();

    auto [result, created] = vk::createInstanceUnique(create_info);
    if (result != vk::Result::eSuccess) {
        return make_vk_error<void>(ErrorCode::vulkan_init_failed,
                                   "Failed to create Vulkan instance", result);
    }

    instance = std::move(created);
    VULKAN_HPP_DEFAULT_DISPATCHER.init(*instance);
    return {};
}

auto VulkanEngine::Impl::select_physical_device(dev_t drm_device) -> Result<void> {
    auto [result, devices] = instance->enumeratePhysicalDevices();
    if (result != vk::Result::eSuccess || devices.empty()) {
        return make_error<void>(ErrorCode::vulkan_init_failed, "No Vulkan devices found");
    }

    vk::PhysicalDevice fallback;
    uint32_t fallback_family = UINT32_MAX;

    for (const auto& candidate : devices) {
        auto [ext_result, available] = candidate.enumerateDeviceExtensionProperties();
        if (ext_result != vk::Result::eSuccess) {
            continue;
        }
        bool all_found = std::all_of(
            REQUIRED_DEVICE_EXTENSIONS.begin(), REQUIRED_DEVICE_EXTENSIONS.end(),
            [&available](const char* name) { return has_extension(available, name); });
        if (!all_found) {
            continue;
        }

        uint32_t graphics_family = UINT32_MAX;
        auto families = candidate.getQueueFamilyProperties();
        for (uint32_t i = 0; i < families.size(); ++i) {
            if (families[i].queueFlags & vk::QueueFlagBits::eGraphics) {
                graphics_family = i;
                break;
            }
        }
        if (graphics_family == UINT32_MAX) {
            continue;
        }

        if (drm_device != 0 &&
            has_extension(available, VK_EXT_PHYSICAL_DEVICE_DRM_EXTENSION_NAME)) {
            auto chain = candidate.getProperties2<vk::PhysicalDeviceProperties2,
                                                  vk::PhysicalDeviceDrmPropertiesEXT>();
            const auto& drm = chain.get<vk::PhysicalDeviceDrmPropertiesEXT>();
            bool primary_match = drm.hasPrimary &&
                                 static_cast<dev_t>(makedev(drm.primaryMajor, drm.primaryMinor)) ==
                                     drm_device;
            bool render_match = drm.hasRender &&
                                static_cast<dev_t>(makedev(drm.renderMajor, drm.renderMinor)) ==
                                    drm_device;
            if (primary_match || render_match) {
                physical_device = candidate;
                queue_family = graphics_family;
                break;
            }
            continue;
        }

        if (!fallback) {
            fallback = candidate;
            fallback_family = graphics_family;
        }
    }

    if (!physical_device) {
        if (!fallback) {
            return make_error<void>(ErrorCode::vulkan_init_failed,
                                    "No GPU with DMA-BUF import support matches the display "
                                    "device");
        }
        KILN_LOG_WARN("Could not match the display device by DRM node; using first capable GPU");
        physical_device = fallback;
        queue_family = fallback_family;
    }

    auto props = physical_device.getProperties();
    KILN_LOG_INFO("Render GPU: {}", props.deviceName.data());
    return {};
}

auto VulkanEngine::Impl::create_device() -> Result<void> {
    float queue_priority = 1.0F;
    vk::DeviceQueueCreateInfo queue_info{};
    queue_info.queueFamilyIndex = queue_family;
    queue_info.queueCount = 1;
    queue_info.pQueuePriorities = &queue_priority;

    vk::DeviceCreateInfo create_info{};
    create_info.queueCreateInfoCount = 1;
    create_info.pQueueCreateInfos = &queue_info;
    create_info.enabledExtensionCount = static_cast<uint32_t>(REQUIRED_DEVICE_EXTENSIONS.size());
    create_info.ppEnabledExtensionNames = REQUIRED_DEVICE_EXTENSIONS.data();

    auto [result, created] = physical_device.createDeviceUnique(create_info);
    if (result != vk::Result::eSuccess) {
        return make_vk_error<void>(ErrorCode::vulkan_init_failed,
                                   "Failed to create logical device", result);
    }

    device = std::move(created);
    VULKAN_HPP_DEFAULT_DISPATCHER.init(*device);
    queue = device->getQueue(queue_family, 0);
    return {};
}

auto VulkanEngine::Impl::create_command_resources() -> Result<void> {
    vk::CommandPoolCreateInfo pool_info{};
    pool_info.flags = vk::CommandPoolCreateFlagBits::eResetCommandBuffer;
    pool_info.queueFamilyIndex = queue_family;

    auto [pool_result, pool] = device->createCommandPoolUnique(pool_info);
    if (pool_result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::vulkan_init_failed, "Failed to create command pool");
    }
    command_pool = std::move(pool);

    vk::CommandBufferAllocateInfo alloc_info{};
    alloc_info.commandPool = *command_pool;
    alloc_info.level = vk::CommandBufferLevel::ePrimary;
    alloc_info.commandBufferCount = 1;

    auto [alloc_result, buffers] = device->allocateCommandBuffers(alloc_info);
    if (alloc_result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::vulkan_init_failed,
                                "Failed to allocate command buffer");
    }
    command_buffer = buffers[0];

    auto [fence_result, created_fence] = device->createFenceUnique(vk::FenceCreateInfo{});
    if (fence_result != vk::Result::eSuccess) {
        return make_error<void>(ErrorCode::vulkan_init_failed, "Failed to create fence");
    }
    fence = std::move(created_fence);
    return {};
}

auto VulkanEngine::Impl::import_dmabuf(const util::ExternalImage& source)
    -> Result<ImportedImage> {
    vk::Format format = util::drm_to_vk_format(source.drm_format);
    if (format == vk::Format::eUndefined) {
        return make_error<ImportedImage>(ErrorCode::import_failed,
                                         "Unsupported DRM format " +
                                             util::drm_format_name(source.drm_format));
    }

    ImportedImage imported{};
    imported.source_fd = source.handle.get();
    imported.width = source.width;
    imported.height = source.height;
    imported.drm_format = source.drm_format;

    vk::ExternalMemoryImageCreateInfo ext_mem_info{};
    ext_mem_info.handleTypes = vk::ExternalMemoryHandleTypeFlagBits::eDmaBufEXT;

    vk::ImageCreateInfo image_info{};
    image_info.pNext = &ext_mem_info;
    image_info.imageType = vk::ImageType::e2D;
    image_info.format = format;
    image_info.extent = vk::Extent3D{source.width, source.height, 1};
    image_info.mipLevels = 1;
    image_info.arrayLayers = 1;
    image_info.samples = vk::SampleCountFlagBits::e1;
    image_info.tiling = vk::ImageTiling::eLinear;
    image_info.usage = vk::ImageUsageFlagBits::eTransferDst | vk::ImageUsageFlagBits::eColorAttachment;
    image_info.sharingMode = vk::SharingMode::eExclusive;
    image_info.initialLayout = vk::ImageLayout::eUndefined;

    auto [img_result, image] = device->createImage(image_info);
    if (img_result != vk::Result::eSuccess) {
        return make_vk_error<ImportedImage>(ErrorCode::import_failed,
                                            "Failed to create DMA-BUF image", img_result);
    }
    imported.image = image;

    vk::ImageSubresource subresource{vk::ImageAspectFlagBits::eColor, 0, 0};
    auto layout = device->getImageSubresourceLayout(imported.image, subresource);
    if (layout.rowPitch != source.stride) {
        destroy_import(imported);
        return make_error<ImportedImage>(ErrorCode::import_failed,
                                         "Linear row pitch " + std::to_string(layout.rowPitch) +
                                             " does not match buffer stride " +
                                             std::to_string(source.stride));
    }

    auto mem_reqs = device->getImageMemoryRequirements(imported.image);

    auto [fd_props_result, fd_props] = device->getMemoryFdPropertiesKHR(
        vk::ExternalMemoryHandleTypeFlagBits::eDmaBufEXT, source.handle.get());
    if (fd_props_result != vk::Result::eSuccess) {
        destroy_import(imported);
        return make_vk_error<ImportedImage>(ErrorCode::import_failed,
                                            "Failed to get DMA-BUF fd properties", fd_props_result);
    }

    auto mem_props = physical_device.getMemoryProperties();
    uint32_t mem_type_index = UINT32_MAX;
    uint32_t combined_bits = mem_reqs.memoryTypeBits & fd_props.memoryTypeBits;
    for (uint32_t i = 0; i < mem_props.memoryTypeCount; ++i) {
        if (combined_bits & (1U << i)) {
            mem_type_index = i;
            break;
        }
    }
    if (mem_type_index == UINT32_MAX) {
        destroy_import(imported);
        return make_error<ImportedImage>(ErrorCode::import_failed,
                                         "No suitable memory type for DMA-BUF import");
    }

    // Vulkan takes ownership of the fd on success
    util::UniqueFd import_fd = source.handle.dup();
    if (!import_fd) {
        destroy_import(imported);
        return make_error<ImportedImage>(ErrorCode::import_failed, "Failed to dup DMA-BUF fd");
    }

    vk::MemoryDedicatedAllocateInfo dedicated_info{};
    dedicated_info.image = imported.image;

    vk::ImportMemoryFdInfoKHR import_info{};
    import_info.pNext = &dedicated_info;
    import_info.handleType = vk::ExternalMemoryHandleTypeFlagBits::eDmaBufEXT;
    import_info.fd = import_fd.get();

    vk::MemoryAllocateInfo alloc_info{};
    alloc_info.pNext = &import_info;
    alloc_info.allocationSize = mem_reqs.size;
    alloc_info.memoryTypeIndex = mem_type_index;

    auto [alloc_result, memory] = device->allocateMemory(alloc_info);
    if (alloc_result != vk::Result::eSuccess) {
        destroy_import(imported);
        return make_vk_error<ImportedImage>(ErrorCode::import_failed,
                                            "Failed to import DMA-BUF memory", alloc_result);
    }
    import_fd.release();
    imported.memory = memory;

    auto bind_result = device->bindImageMemory(imported.image, imported.memory, 0);
    if (bind_result != vk::Result::eSuccess) {
        destroy_import(imported);
        return make_vk_error<ImportedImage>(ErrorCode::import_failed,
                                            "Failed to bind DMA-BUF memory", bind_result);
    }

    imported.id = next_import_id++;
    KILN_LOG_DEBUG("DMA-BUF imported: {}x{}, format={}, target {}", source.width, source.height,
                   vk::to_string(format), imported.id);
    return imported;
}

auto VulkanEngine::Impl::record_frame(const ImportedImage& target, std::array<float, 4> color)
    -> Result<void> {
    vk::CommandBuffer cmd = command_buffer;
    KILN_VK_TRY(cmd.reset(), ErrorCode::vulkan_device_lost, "Command buffer reset failed");

    vk::CommandBufferBeginInfo begin_info{};
    begin_info.flags = vk::CommandBufferUsageFlagBits::eOneTimeSubmit;
    KILN_VK_TRY(cmd.begin(begin_info), ErrorCode::vulkan_device_lost,
                "Command buffer begin failed");

    vk::ImageMemoryBarrier barrier{};
    barrier.srcAccessMask = vk::AccessFlagBits::eNone;
    barrier.dstAccessMask = vk::AccessFlagBits::eTransferWrite;
    barrier.oldLayout = vk::ImageLayout::eUndefined;
    barrier.newLayout = vk::ImageLayout::eTransferDstOptimal;
    barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
    barrier.image = target.image;
    barrier.subresourceRange.aspectMask = vk::ImageAspectFlagBits::eColor;
    barrier.subresourceRange.baseMipLevel = 0;
    barrier.subresourceRange.levelCount = 1;
    barrier.subresourceRange.baseArrayLayer = 0;
    barrier.subresourceRange.layerCount = 1;

    cmd.pipelineBarrier(vk::PipelineStageFlagBits::eTopOfPipe, vk::PipelineStageFlagBits::eTransfer,
                        {}, {}, {}, barrier);

    vk::ClearColorValue clear_color{color};
    cmd.clearColorImage(target.image, vk::ImageLayout::eTransferDstOptimal, clear_color,
                        barrier.subresourceRange);

    // The display engine reads the buffer in place; leave it in a layout valid for any access.
    barrier.srcAccessMask = vk::AccessFlagBits::eTransferWrite;
    barrier.dstAccessMask = vk::AccessFlagBits::eMemoryRead;
    barrier.oldLayout = vk::ImageLayout::eTransferDstOptimal;
    barrier.newLayout = vk::ImageLayout::eGeneral;

    cmd.pipelineBarrier(vk::PipelineStageFlagBits::eTransfer,
                        vk::PipelineStageFlagBits::eBottomOfPipe, {}, {}, {}, barrier);

    KILN_VK_TRY(cmd.end(), ErrorCode::vulkan_device_lost, "Command buffer end failed");
    return {};
}

auto VulkanEngine::Impl::submit_and_wait() -> Result<void> {
    vk::SubmitInfo submit_info{};
    submit_info.commandBufferCount = 1;
    submit_info.pCommandBuffers = &command_buffer;

    KILN_VK_TRY(queue.submit(submit_info, *fence), ErrorCode::vulkan_device_lost,
                "Queue submit failed");

    auto waited = device->waitForFences(*fence, VK_TRUE, FENCE_TIMEOUT_NS);
    if (waited != vk::Result::eSuccess) {
        // The submission is still pending: drain the queue before the fence or the command
        // buffer are reused.
        auto idle = device->waitIdle();
        if (idle != vk::Result::eSuccess) {
            lost = true;
            KILN_LOG_ERROR("Frame fence wait failed ({}) and the device did not drain ({})",
                           vk::to_string(waited), vk::to_string(idle));
            return make_vk_error<void>(ErrorCode::vulkan_device_lost, "Device did not drain",
                                       idle);
        }
        if (auto reset = device->resetFences(*fence); reset != vk::Result::eSuccess) {
            lost = true;
            return make_vk_error<void>(ErrorCode::vulkan_device_lost, "Fence reset failed", reset);
        }
        return make_vk_error<void>(ErrorCode::render_failed, "Frame fence wait failed", waited);
    }
    if (auto reset = device->resetFences(*fence); reset != vk::Result::eSuccess) {
        lost = true;
        return make_vk_error<void>(ErrorCode::vulkan_device_lost, "Fence reset failed", reset);
    }
    return {};
}

void VulkanEngine::Impl::handle_keys(runtime::AppChannel& channel) {
    for (const auto& key : channel.drain_keys()) {
        KILN_LOG_TRACE("Engine key {} ({}) {}", key.name, key.keycode,
                       key.pressed ? "pressed" : "released");
        if (!key.pressed || key.keysym != XKB_KEY_space) {
            continue;
        }
        if (paused_at < 0.0F) {
            paused_at = animation_time();
            KILN_LOG_INFO("Animation paused");
        } else {
            auto resumed_offset = std::chrono::duration<float>(paused_at);
            start = std::chrono::steady_clock::now() -
                    std::chrono::duration_cast<std::chrono::steady_clock::duration>(resumed_offset);
            paused_at = -1.0F;
            KILN_LOG_INFO("Animation resumed");
        }
    }
}

auto VulkanEngine::Impl::animation_time() const -> float {
    if (paused_at >= 0.0F) {
        return paused_at;
    }
    return std::chrono::duration<float>(std::chrono::steady_clock::now() - start).count();
}

VulkanEngine::VulkanEngine() : m_impl(std::make_unique<Impl>()) {}

VulkanEngine::~VulkanEngine() = default;

auto VulkanEngine::create(const Settings& settings) -> ResultPtr<VulkanEngine> {
    KILN_PROFILE_FUNCTION();
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

    auto engine = std::unique_ptr<VulkanEngine>(new VulkanEngine());
    auto& impl = *engine->m_impl;
    auto setup = [&impl, &settings]() -> Result<void> {
        KILN_TRY(impl.create_instance(settings.enable_validation));
        KILN_TRY(impl.select_physical_device(settings.drm_device));
        KILN_TRY(impl.create_device());
        KILN_TRY(impl.create_command_resources());
        return {};
    }();
    if (!setup) {
        return nonstd::make_unexpected(setup.error());
    }

    KILN_LOG_INFO("Vulkan engine initialized");
    return make_result_ptr(std::move(engine));
}

auto VulkanEngine::import_target(const util::ExternalImage& image) -> Result<FrameTarget> {
    KILN_PROFILE_FUNCTION();
    auto& impl = *m_impl;
    auto cached = std::find_if(impl.imports.begin(), impl.imports.end(), [&image](const auto& i) {
        return i.source_fd == image.handle.get() && i.width == image.width &&
               i.height == image.height && i.drm_format == image.drm_format;
    });
    if (cached == impl.imports.end()) {
        auto imported = KILN_TRY(impl.import_dmabuf(image));
        impl.imports.push_back(imported);
        cached = std::prev(impl.imports.end());
    }

    return FrameTarget{
        .id = cached->id,
        .width = cached->width,
        .height = cached->height,
        .drm_format = cached->drm_format,
    };
}

void VulkanEngine::attach_target(TargetHandle /*handle*/, const FrameTarget& target) {
    auto& impl = *m_impl;
    auto it = std::find_if(impl.imports.begin(), impl.imports.end(),
                           [&target](const auto& i) { return i.id == target.id; });
    impl.attached = it != impl.imports.end() ? &*it : nullptr;
}

auto VulkanEngine::update(runtime::AppChannel& channel) -> Result<void> {
    KILN_PROFILE_FUNCTION();
    auto& impl = *m_impl;
    impl.handle_keys(channel);

    if (impl.lost) {
        return make_error<void>(ErrorCode::vulkan_device_lost, "Vulkan device lost");
    }
    if (!impl.attached) {
        return make_error<void>(ErrorCode::render_failed, "No render target attached");
    }

    KILN_TRY(impl.record_frame(*impl.attached, animated_color(impl.animation_time())));
    KILN_TRY(impl.submit_and_wait());
    ++impl.frames;
    return {};
}

void VulkanEngine::release_target(TargetHandle /*handle*/, const FrameTarget& /*target*/) {
    m_impl->attached = nullptr;
}

} // namespace kiln::render
