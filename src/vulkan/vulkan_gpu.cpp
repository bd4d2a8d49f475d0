#include <vkframe/vulkan_gpu.hpp>
#include <vkframe/log.hpp>

#include <SDL3/SDL_error.h>
#include <SDL3/SDL_video.h>
#include <SDL3/SDL_vulkan.h>
#include <vk_mem_alloc.h>

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace vkframe {

static const char* kValidationLayer = "VK_LAYER_KHRONOS_validation";

static Error vkError(const char* operation, VkResult vr, std::string message) {
    return Error{operation, static_cast<std::int32_t>(vr), std::move(message)};
}

static VKAPI_ATTR VkBool32 VKAPI_CALL debugCallback(
    VkDebugUtilsMessageSeverityFlagBitsEXT severity,
    VkDebugUtilsMessageTypeFlagsEXT /*type*/,
    const VkDebugUtilsMessengerCallbackDataEXT* data,
    void* /*userData*/) {
    LogLevel level = (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT)
                         ? LogLevel::Error
                         : LogLevel::Warn;
    log(level, "validation: %s", data->pMessage);
    return VK_FALSE;
}

static bool hasLayer(const char* name) {
    std::uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    vkEnumerateInstanceLayerProperties(&count, layers.data());
    for (auto& layer : layers) {
        if (std::strcmp(layer.layerName, name) == 0) return true;
    }
    return false;
}

static bool hasDeviceExtension(VkPhysicalDevice gpu, const char* name) {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> exts(count);
    vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, exts.data());
    for (auto& ext : exts) {
        if (std::strcmp(ext.extensionName, name) == 0) return true;
    }
    return false;
}

static VkImageCreateInfo imageInfo(const ImageDesc& desc) {
    VkImageCreateInfo ci{};
    ci.sType         = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    ci.imageType     = desc.extent.depth > 1 ? VK_IMAGE_TYPE_3D : VK_IMAGE_TYPE_2D;
    ci.format        = desc.format;
    ci.extent        = desc.extent;
    ci.mipLevels     = desc.mipLevels;
    ci.arrayLayers   = 1;
    ci.samples       = desc.samples;
    ci.tiling        = VK_IMAGE_TILING_OPTIMAL;
    ci.usage         = desc.usage;
    ci.sharingMode   = VK_SHARING_MODE_EXCLUSIVE;
    ci.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    return ci;
}

// Representative images used to find which memory types pages may use.
static ImageDesc pageProbe(MemoryKind kind) {
    ImageDesc d;
    d.extent = {64, 64, 1};
    if (kind == MemoryKind::DepthStencilImage) {
        d.format = VK_FORMAT_D32_SFLOAT;
        d.usage  = VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
        d.aspect = VK_IMAGE_ASPECT_DEPTH_BIT;
    } else {
        d.format = VK_FORMAT_R8G8B8A8_UNORM;
        d.usage  = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT |
                   VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    }
    return d;
}

static void transition(VkCommandBuffer cmd, VkImage image,
                       VkImageLayout oldLayout, VkImageLayout newLayout,
                       VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess,
                       VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess) {
    VkImageMemoryBarrier2 barrier{};
    barrier.sType            = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
    barrier.srcStageMask     = srcStage;
    barrier.srcAccessMask    = srcAccess;
    barrier.dstStageMask     = dstStage;
    barrier.dstAccessMask    = dstAccess;
    barrier.oldLayout        = oldLayout;
    barrier.newLayout        = newLayout;
    barrier.image            = image;
    barrier.subresourceRange = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 1, 0, 1};

    VkDependencyInfo dep{};
    dep.sType                   = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
    dep.imageMemoryBarrierCount = 1;
    dep.pImageMemoryBarriers    = &barrier;

    vkCmdPipelineBarrier2(cmd, &dep);
}

// Records a one-time command buffer holding a single layout transition.
static Result<void> recordTransition(VkCommandBuffer cmd, VkImage image,
                                     VkImageLayout oldLayout, VkImageLayout newLayout,
                                     VkPipelineStageFlags2 srcStage, VkAccessFlags2 srcAccess,
                                     VkPipelineStageFlags2 dstStage, VkAccessFlags2 dstAccess) {
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    VkResult vr = vkBeginCommandBuffer(cmd, &bi);
    if (vr != VK_SUCCESS) {
        return vkError("record swapchain transition", vr, "vkBeginCommandBuffer failed");
    }

    transition(cmd, image, oldLayout, newLayout, srcStage, srcAccess, dstStage, dstAccess);

    vr = vkEndCommandBuffer(cmd);
    if (vr != VK_SUCCESS) {
        return vkError("record swapchain transition", vr, "vkEndCommandBuffer failed");
    }
    return {};
}

Result<std::unique_ptr<VulkanGpu>> VulkanGpu::create(SDL_Window* window,
                                                      const VulkanGpuOptions& options) {
    if (window == nullptr) {
        return Error{"create gpu", 0, "window is null"};
    }

    std::unique_ptr<VulkanGpu> gpu(new VulkanGpu());

    auto r = gpu->createInstance(options);
    if (!r.ok()) return r.error();
    r = gpu->createSurface(window);
    if (!r.ok()) return r.error();
    r = gpu->pickPhysicalDevice();
    if (!r.ok()) return r.error();
    r = gpu->createDevice(options);
    if (!r.ok()) return r.error();
    r = gpu->createAllocator();
    if (!r.ok()) return r.error();
    r = gpu->queryPageMemoryTypes();
    if (!r.ok()) return r.error();

    gpu->presentMode_         = VK_PRESENT_MODE_FIFO_KHR;
    gpu->imageCountRequested_ = options.imageCount;
    {
        std::uint32_t modeCount = 0;
        vkGetPhysicalDeviceSurfacePresentModesKHR(gpu->physicalDevice_, gpu->surface_,
                                                  &modeCount, nullptr);
        std::vector<VkPresentModeKHR> modes(modeCount);
        vkGetPhysicalDeviceSurfacePresentModesKHR(gpu->physicalDevice_, gpu->surface_,
                                                  &modeCount, modes.data());
        auto hasMode = [&](VkPresentModeKHR m) {
            return std::find(modes.begin(), modes.end(), m) != modes.end();
        };
        switch (options.presentMode) {
        case PresentMode::Fifo:
            break;
        case PresentMode::Mailbox:
        case PresentMode::MailboxOrFifo:
            if (hasMode(VK_PRESENT_MODE_MAILBOX_KHR)) gpu->presentMode_ = VK_PRESENT_MODE_MAILBOX_KHR;
            break;
        case PresentMode::Immediate:
            if (hasMode(VK_PRESENT_MODE_IMMEDIATE_KHR)) gpu->presentMode_ = VK_PRESENT_MODE_IMMEDIATE_KHR;
            break;
        }
    }

    int w = 0;
    int h = 0;
    SDL_GetWindowSizeInPixels(window, &w, &h);
    r = gpu->createSwapchain({static_cast<std::uint32_t>(std::max(w, 1)),
                              static_cast<std::uint32_t>(std::max(h, 1))});
    if (!r.ok()) return r.error();

    log(LogLevel::Info, "gpu: %s, swapchain %ux%u with %zu images", gpu->gpuName_.c_str(),
        gpu->extent_.width, gpu->extent_.height, gpu->images_.size());
    return gpu;
}

VulkanGpu::~VulkanGpu() {
    if (device_ != VK_NULL_HANDLE) {
        vkDeviceWaitIdle(device_);
        destroySwapchainViews();
        if (swapchain_ != VK_NULL_HANDLE) vkDestroySwapchainKHR(device_, swapchain_, nullptr);
    }
    if (allocator_ != nullptr) vmaDestroyAllocator(allocator_);
    if (device_ != VK_NULL_HANDLE) vkDestroyDevice(device_, nullptr);
    if (surface_ != VK_NULL_HANDLE) SDL_Vulkan_DestroySurface(instance_, surface_, nullptr);
    if (messenger_ != VK_NULL_HANDLE) {
        auto destroyFn = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT"));
        if (destroyFn) destroyFn(instance_, messenger_, nullptr);
    }
    if (instance_ != VK_NULL_HANDLE) vkDestroyInstance(instance_, nullptr);
}

Result<void> VulkanGpu::createInstance(const VulkanGpuOptions& options) {
    Uint32 sdlCount = 0;
    const char* const* sdlExts = SDL_Vulkan_GetInstanceExtensions(&sdlCount);
    if (sdlExts == nullptr) {
        return Error{"create instance", 0,
                     std::string("SDL_Vulkan_GetInstanceExtensions failed: ") + SDL_GetError()};
    }
    std::vector<const char*> extensions(sdlExts, sdlExts + sdlCount);
    std::vector<const char*> layers;

    validation_ = options.validation;
    if (validation_ && !hasLayer(kValidationLayer)) {
        log(LogLevel::Warn, "validation requested but %s is not installed", kValidationLayer);
        validation_ = false;
    }
    if (validation_) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        layers.push_back(kValidationLayer);
    }

    VkApplicationInfo appInfo{};
    appInfo.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    appInfo.pApplicationName   = options.appName.c_str();
    appInfo.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    appInfo.pEngineName        = "vkframe";
    appInfo.apiVersion         = VK_API_VERSION_1_3;

    VkDebugUtilsMessengerCreateInfoEXT debugCI{};
    debugCI.sType           = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    debugCI.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT |
                              VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    debugCI.messageType     = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                              VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                              VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    debugCI.pfnUserCallback = debugCallback;

    VkInstanceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    ci.pApplicationInfo        = &appInfo;
    ci.enabledExtensionCount   = static_cast<std::uint32_t>(extensions.size());
    ci.ppEnabledExtensionNames = extensions.data();
    ci.enabledLayerCount       = static_cast<std::uint32_t>(layers.size());
    ci.ppEnabledLayerNames     = layers.data();
    if (validation_) ci.pNext = &debugCI;

    VkResult vr = vkCreateInstance(&ci, nullptr, &instance_);
    if (vr != VK_SUCCESS) {
        return vkError("create instance", vr,
                       vr == VK_ERROR_INCOMPATIBLE_DRIVER
                           ? "driver does not support Vulkan 1.3"
                           : "vkCreateInstance failed");
    }

    if (validation_) {
        auto createFn = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT"));
        if (createFn) createFn(instance_, &debugCI, nullptr, &messenger_);
    }
    return {};
}

Result<void> VulkanGpu::createSurface(SDL_Window* window) {
    if (!SDL_Vulkan_CreateSurface(window, instance_, nullptr, &surface_)) {
        return Error{"create surface", 0,
                     std::string("SDL_Vulkan_CreateSurface failed: ") + SDL_GetError()};
    }
    return {};
}

Result<void> VulkanGpu::pickPhysicalDevice() {
    std::uint32_t count = 0;
    vkEnumeratePhysicalDevices(instance_, &count, nullptr);
    if (count == 0) {
        return Error{"select GPU", 0, "no Vulkan-capable GPUs found"};
    }
    std::vector<VkPhysicalDevice> gpus(count);
    vkEnumeratePhysicalDevices(instance_, &count, gpus.data());

    int bestScore = -1;
    for (auto gpu : gpus) {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(gpu, &props);
        if (props.apiVersion < VK_API_VERSION_1_3) continue;
        if (!hasDeviceExtension(gpu, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) continue;

        // A single family doing both graphics and present keeps every
        // submission and the present on one queue.
        std::uint32_t familyCount = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &familyCount, nullptr);
        std::vector<VkQueueFamilyProperties> families(familyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(gpu, &familyCount, families.data());

        std::uint32_t family = UINT32_MAX;
        for (std::uint32_t i = 0; i < familyCount; ++i) {
            VkBool32 present = VK_FALSE;
            vkGetPhysicalDeviceSurfaceSupportKHR(gpu, i, surface_, &present);
            if ((families[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) && present) {
                family = i;
                break;
            }
        }
        if (family == UINT32_MAX) continue;

        int score = 1;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) score += 1000;
        if (props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU) score += 100;
        if (score > bestScore) {
            bestScore       = score;
            physicalDevice_ = gpu;
            queueFamily_    = family;
            gpuName_        = props.deviceName;
        }
    }

    if (physicalDevice_ == VK_NULL_HANDLE) {
        return Error{"select GPU", 0,
                     "no GPU with Vulkan 1.3, VK_KHR_swapchain and a graphics+present queue"};
    }
    return {};
}

Result<void> VulkanGpu::createDevice(const VulkanGpuOptions& options) {
    VkPhysicalDeviceVulkan13Features supported13{};
    supported13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    VkPhysicalDeviceFeatures2 query{};
    query.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    query.pNext = &supported13;
    vkGetPhysicalDeviceFeatures2(physicalDevice_, &query);
    if (!supported13.synchronization2 || !supported13.dynamicRendering) {
        return Error{"create device", 0,
                     gpuName_ + " lacks synchronization2 or dynamicRendering"};
    }

    VkPhysicalDeviceVulkan13Features features13{};
    features13.sType            = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    features13.synchronization2 = VK_TRUE;
    features13.dynamicRendering = VK_TRUE;
    features13.maintenance4     = supported13.maintenance4;

    VkPhysicalDeviceFeatures2 features{};
    features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features.pNext = &features13;

    float priority = 1.0f;
    VkDeviceQueueCreateInfo qci{};
    qci.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    qci.queueFamilyIndex = queueFamily_;
    qci.queueCount       = 1;
    qci.pQueuePriorities = &priority;

    const char* extensions[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    VkDeviceCreateInfo ci{};
    ci.sType                   = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    ci.pNext                   = &features;
    ci.queueCreateInfoCount    = 1;
    ci.pQueueCreateInfos       = &qci;
    ci.enabledExtensionCount   = 1;
    ci.ppEnabledExtensionNames = extensions;

    VkResult vr = vkCreateDevice(physicalDevice_, &ci, nullptr, &device_);
    if (vr != VK_SUCCESS) {
        return vkError("create device", vr, "vkCreateDevice failed on " + gpuName_);
    }
    vkGetDeviceQueue(device_, queueFamily_, 0, &queue_);

    VkPhysicalDeviceProperties props;
    vkGetPhysicalDeviceProperties(physicalDevice_, &props);
    limits_.bufferCopyOffsetAlignment    = props.limits.optimalBufferCopyOffsetAlignment;
    limits_.texelBufferOffsetAlignment   = props.limits.minTexelBufferOffsetAlignment;
    limits_.uniformBufferOffsetAlignment = props.limits.minUniformBufferOffsetAlignment;
    limits_.storageBufferOffsetAlignment = props.limits.minStorageBufferOffsetAlignment;
    if (options.forceMaxAlignment) {
        VkDeviceSize a = std::max({limits_.bufferCopyOffsetAlignment,
                                   limits_.texelBufferOffsetAlignment,
                                   limits_.uniformBufferOffsetAlignment,
                                   limits_.storageBufferOffsetAlignment});
        limits_.bufferCopyOffsetAlignment    = a;
        limits_.texelBufferOffsetAlignment   = a;
        limits_.uniformBufferOffsetAlignment = a;
        limits_.storageBufferOffsetAlignment = a;
    }
    return {};
}

Result<void> VulkanGpu::createAllocator() {
    VmaAllocatorCreateInfo ci{};
    ci.instance         = instance_;
    ci.physicalDevice   = physicalDevice_;
    ci.device           = device_;
    ci.vulkanApiVersion = VK_API_VERSION_1_3;

    VkResult vr = vmaCreateAllocator(&ci, &allocator_);
    if (vr != VK_SUCCESS) {
        return vkError("create allocator", vr, "vmaCreateAllocator failed");
    }
    return {};
}

Result<void> VulkanGpu::queryPageMemoryTypes() {
    auto typeBits = [&](const ImageDesc& desc) {
        VkImageCreateInfo ici = imageInfo(desc);
        VkDeviceImageMemoryRequirements info{};
        info.sType       = VK_STRUCTURE_TYPE_DEVICE_IMAGE_MEMORY_REQUIREMENTS;
        info.pCreateInfo = &ici;
        VkMemoryRequirements2 reqs{};
        reqs.sType = VK_STRUCTURE_TYPE_MEMORY_REQUIREMENTS_2;
        vkGetDeviceImageMemoryRequirements(device_, &info, &reqs);
        return reqs.memoryRequirements.memoryTypeBits;
    };
    colorTypeBits_ = typeBits(pageProbe(MemoryKind::ColorImage));
    depthTypeBits_ = typeBits(pageProbe(MemoryKind::DepthStencilImage));
    if (colorTypeBits_ == 0 || depthTypeBits_ == 0) {
        return Error{"query page memory types", 0, "no memory type accepts render targets"};
    }
    return {};
}

Result<VmaAllocation> VulkanGpu::allocateMemory(MemoryKind kind, VkDeviceSize size,
                                                const std::string& name) {
    VkMemoryRequirements reqs{};
    reqs.size           = size;
    reqs.alignment      = 1;
    reqs.memoryTypeBits = kind == MemoryKind::DepthStencilImage ? depthTypeBits_ : colorTypeBits_;

    VmaAllocationCreateInfo aci{};
    aci.flags          = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
    aci.preferredFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;

    VmaAllocation allocation = nullptr;
    VkResult vr = vmaAllocateMemory(allocator_, &reqs, &aci, &allocation, nullptr);
    if (vr != VK_SUCCESS) {
        return vkError("allocate memory", vr,
                       "vmaAllocateMemory failed for " + std::to_string(size) + " bytes");
    }
    vmaSetAllocationName(allocator_, allocation, name.c_str());
    return allocation;
}

void VulkanGpu::freeMemory(VmaAllocation memory) {
    if (memory != nullptr) vmaFreeMemory(allocator_, memory);
}

Result<MemoryRequirements> VulkanGpu::imageMemoryRequirements(const ImageDesc& desc) {
    VkImageCreateInfo ici = imageInfo(desc);

    VkDeviceImageMemoryRequirements info{};
    info.sType       = VK_STRUCTURE_TYPE_DEVICE_IMAGE_MEMORY_REQUIREMENTS;
    info.pCreateInfo = &ici;

    VkMemoryDedicatedRequirements dedicated{};
    dedicated.sType = VK_STRUCTURE_TYPE_MEMORY_DEDICATED_REQUIREMENTS;
    VkMemoryRequirements2 reqs{};
    reqs.sType = VK_STRUCTURE_TYPE_MEMORY_REQUIREMENTS_2;
    reqs.pNext = &dedicated;

    vkGetDeviceImageMemoryRequirements(device_, &info, &reqs);

    MemoryRequirements out;
    out.size      = reqs.memoryRequirements.size;
    out.alignment = reqs.memoryRequirements.alignment;
    if (dedicated.requiresDedicatedAllocation) {
        out.dedicated = DedicatedAllocation::Required;
    } else if (dedicated.prefersDedicatedAllocation) {
        out.dedicated = DedicatedAllocation::Preferred;
    }
    return out;
}

Result<VkImageView> VulkanGpu::createView(VkImage image, const ImageDesc& desc) {
    VkImageViewCreateInfo ci{};
    ci.sType    = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
    ci.image    = image;
    ci.viewType = desc.extent.depth > 1 ? VK_IMAGE_VIEW_TYPE_3D : VK_IMAGE_VIEW_TYPE_2D;
    ci.format   = desc.format;
    ci.subresourceRange.aspectMask     = desc.aspect;
    ci.subresourceRange.baseMipLevel   = 0;
    ci.subresourceRange.levelCount     = desc.mipLevels;
    ci.subresourceRange.baseArrayLayer = 0;
    ci.subresourceRange.layerCount     = 1;

    VkImageView view = VK_NULL_HANDLE;
    VkResult vr = vkCreateImageView(device_, &ci, nullptr, &view);
    if (vr != VK_SUCCESS) {
        return vkError("create image view", vr, "vkCreateImageView failed");
    }
    return view;
}

Result<PlacedImage> VulkanGpu::createPlacedImage(const ImageDesc& desc, VmaAllocation memory,
                                                 VkDeviceSize offset) {
    VkImageCreateInfo ici = imageInfo(desc);
    VkImage image = VK_NULL_HANDLE;
    VkResult vr = vkCreateImage(device_, &ici, nullptr, &image);
    if (vr != VK_SUCCESS) {
        return vkError("create placed image", vr, "vkCreateImage failed");
    }

    VkMemoryRequirements reqs;
    vkGetImageMemoryRequirements(device_, image, &reqs);
    VmaAllocationInfo info{};
    vmaGetAllocationInfo(allocator_, memory, &info);
    if ((reqs.memoryTypeBits & (1u << info.memoryType)) == 0) {
        vkDestroyImage(device_, image, nullptr);
        return Error{"create placed image", 0,
                     "page memory type " + std::to_string(info.memoryType) +
                     " cannot back this image"};
    }

    vr = vmaBindImageMemory2(allocator_, memory, offset, image, nullptr);
    if (vr != VK_SUCCESS) {
        vkDestroyImage(device_, image, nullptr);
        return vkError("create placed image", vr,
                       "vmaBindImageMemory2 failed at offset " + std::to_string(offset));
    }

    auto view = createView(image, desc);
    if (!view.ok()) {
        vkDestroyImage(device_, image, nullptr);
        return view.error();
    }
    return PlacedImage{image, view.value()};
}

Result<DedicatedImage> VulkanGpu::createDedicatedImage(const ImageDesc& desc, MemoryKind kind) {
    VkImageCreateInfo ici = imageInfo(desc);

    VmaAllocationCreateInfo aci{};
    aci.usage = VMA_MEMORY_USAGE_AUTO_PREFER_DEVICE;
    aci.flags = VMA_ALLOCATION_CREATE_DEDICATED_MEMORY_BIT;
    aci.memoryTypeBits = kind == MemoryKind::DepthStencilImage ? depthTypeBits_ : colorTypeBits_;

    DedicatedImage out;
    VkResult vr = vmaCreateImage(allocator_, &ici, &aci, &out.handle, &out.memory, nullptr);
    if (vr == VK_ERROR_FEATURE_NOT_PRESENT) {
        // The image needs a memory type pages never use.
        aci.memoryTypeBits = 0;
        vr = vmaCreateImage(allocator_, &ici, &aci, &out.handle, &out.memory, nullptr);
    }
    if (vr != VK_SUCCESS) {
        return vkError("create dedicated image", vr, "vmaCreateImage failed");
    }

    auto view = createView(out.handle, desc);
    if (!view.ok()) {
        vmaDestroyImage(allocator_, out.handle, out.memory);
        return view.error();
    }
    out.view = view.value();
    return out;
}

void VulkanGpu::destroyImage(VkImage image) {
    if (image != VK_NULL_HANDLE) vkDestroyImage(device_, image, nullptr);
}

void VulkanGpu::destroyImageView(VkImageView view) {
    if (view != VK_NULL_HANDLE) vkDestroyImageView(device_, view, nullptr);
}

void VulkanGpu::destroySampler(VkSampler sampler) {
    if (sampler != VK_NULL_HANDLE) vkDestroySampler(device_, sampler, nullptr);
}

Result<BufferAllocation> VulkanGpu::createBuffer(const BufferDesc& desc) {
    VkBufferCreateInfo bci{};
    bci.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    bci.size        = desc.size;
    bci.usage       = desc.usage;
    bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo aci{};
    aci.usage = VMA_MEMORY_USAGE_AUTO;
    if (desc.hostVisible) {
        aci.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT |
                    VMA_ALLOCATION_CREATE_MAPPED_BIT;
    }

    BufferAllocation out;
    VmaAllocationInfo info{};
    VkResult vr = vmaCreateBuffer(allocator_, &bci, &aci, &out.handle, &out.memory, &info);
    if (vr != VK_SUCCESS) {
        return vkError("create buffer", vr,
                       "vmaCreateBuffer failed for " + std::to_string(desc.size) + " bytes");
    }
    out.size   = desc.size;
    out.mapped = desc.hostVisible ? info.pMappedData : nullptr;
    return out;
}

void VulkanGpu::destroyBuffer(VkBuffer buffer) {
    if (buffer != VK_NULL_HANDLE) vkDestroyBuffer(device_, buffer, nullptr);
}

Result<VkFence> VulkanGpu::createFence(bool signaled) {
    VkFenceCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    if (signaled) ci.flags = VK_FENCE_CREATE_SIGNALED_BIT;

    VkFence fence = VK_NULL_HANDLE;
    VkResult vr = vkCreateFence(device_, &ci, nullptr, &fence);
    if (vr != VK_SUCCESS) return vkError("create fence", vr, "vkCreateFence failed");
    return fence;
}

void VulkanGpu::destroyFence(VkFence fence) {
    if (fence != VK_NULL_HANDLE) vkDestroyFence(device_, fence, nullptr);
}

Result<void> VulkanGpu::waitForFence(VkFence fence) {
    VkResult vr = vkWaitForFences(device_, 1, &fence, VK_TRUE, UINT64_MAX);
    if (vr != VK_SUCCESS) return vkError("wait for fence", vr, "vkWaitForFences failed");
    return {};
}

Result<void> VulkanGpu::resetFence(VkFence fence) {
    VkResult vr = vkResetFences(device_, 1, &fence);
    if (vr != VK_SUCCESS) return vkError("reset fence", vr, "vkResetFences failed");
    return {};
}

Result<VkSemaphore> VulkanGpu::createSemaphore() {
    VkSemaphoreCreateInfo ci{};
    ci.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

    VkSemaphore sem = VK_NULL_HANDLE;
    VkResult vr = vkCreateSemaphore(device_, &ci, nullptr, &sem);
    if (vr != VK_SUCCESS) return vkError("create semaphore", vr, "vkCreateSemaphore failed");
    return sem;
}

void VulkanGpu::destroySemaphore(VkSemaphore semaphore) {
    if (semaphore != VK_NULL_HANDLE) vkDestroySemaphore(device_, semaphore, nullptr);
}

Result<VkCommandPool> VulkanGpu::createCommandPool() {
    VkCommandPoolCreateInfo ci{};
    ci.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    ci.flags            = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    ci.queueFamilyIndex = queueFamily_;

    VkCommandPool pool = VK_NULL_HANDLE;
    VkResult vr = vkCreateCommandPool(device_, &ci, nullptr, &pool);
    if (vr != VK_SUCCESS) return vkError("create command pool", vr, "vkCreateCommandPool failed");
    return pool;
}

void VulkanGpu::destroyCommandPool(VkCommandPool pool) {
    if (pool != VK_NULL_HANDLE) vkDestroyCommandPool(device_, pool, nullptr);
}

Result<void> VulkanGpu::resetCommandPool(VkCommandPool pool) {
    VkResult vr = vkResetCommandPool(device_, pool, 0);
    if (vr != VK_SUCCESS) return vkError("reset command pool", vr, "vkResetCommandPool failed");
    return {};
}

Result<VkCommandBuffer> VulkanGpu::allocateCommandBuffer(VkCommandPool pool) {
    VkCommandBufferAllocateInfo ai{};
    ai.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    ai.commandPool        = pool;
    ai.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    ai.commandBufferCount = 1;

    VkCommandBuffer cmd = VK_NULL_HANDLE;
    VkResult vr = vkAllocateCommandBuffers(device_, &ai, &cmd);
    if (vr != VK_SUCCESS) {
        return vkError("allocate command buffer", vr, "vkAllocateCommandBuffers failed");
    }
    return cmd;
}

Result<void> VulkanGpu::recordAcquireTransition(VkCommandBuffer cmd, VkImage image) {
    // Source stage matches the acquire semaphore's wait stage so the layout
    // change happens after the presentation engine releases the image.
    return recordTransition(cmd, image,
                            VK_IMAGE_LAYOUT_UNDEFINED,
                            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT, 0,
                            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                            VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT);
}

Result<void> VulkanGpu::recordPresentTransition(VkCommandBuffer cmd, VkImage image) {
    return recordTransition(cmd, image,
                            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                            VK_IMAGE_LAYOUT_PRESENT_SRC_KHR,
                            VK_PIPELINE_STAGE_2_COLOR_ATTACHMENT_OUTPUT_BIT,
                            VK_ACCESS_2_COLOR_ATTACHMENT_WRITE_BIT,
                            VK_PIPELINE_STAGE_2_NONE, 0);
}

Result<void> VulkanGpu::submit(const SubmitDesc& desc) {
    std::vector<VkCommandBufferSubmitInfo> cmds(desc.cmdCount);
    for (std::uint32_t i = 0; i < desc.cmdCount; ++i) {
        cmds[i].sType         = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
        cmds[i].commandBuffer = desc.cmds[i];
    }

    VkSemaphoreSubmitInfo wait{};
    wait.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    wait.semaphore = desc.wait;
    wait.stageMask = desc.waitStage;

    VkSemaphoreSubmitInfo signal{};
    signal.sType     = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO;
    signal.semaphore = desc.signal;
    signal.stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;

    VkSubmitInfo2 si{};
    si.sType                    = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    si.commandBufferInfoCount   = desc.cmdCount;
    si.pCommandBufferInfos      = cmds.empty() ? nullptr : cmds.data();
    si.waitSemaphoreInfoCount   = desc.wait != VK_NULL_HANDLE ? 1 : 0;
    si.pWaitSemaphoreInfos      = &wait;
    si.signalSemaphoreInfoCount = desc.signal != VK_NULL_HANDLE ? 1 : 0;
    si.pSignalSemaphoreInfos    = &signal;

    VkResult vr = vkQueueSubmit2(queue_, 1, &si, desc.fence);
    if (vr != VK_SUCCESS) return vkError("queue submit", vr, "vkQueueSubmit2 failed");
    return {};
}

SwapchainImage VulkanGpu::swapchainImage(std::uint32_t index) const {
    SwapchainImage img;
    img.index  = index;
    img.image  = images_[index];
    img.view   = views_[index];
    img.extent = extent_;
    return img;
}

Result<AcquireResult> VulkanGpu::acquireNextImage(VkSemaphore imageReady) {
    AcquireResult r;
    VkResult vr = vkAcquireNextImageKHR(device_, swapchain_, UINT64_MAX, imageReady,
                                        VK_NULL_HANDLE, &r.index);
    switch (vr) {
    case VK_SUCCESS:
        r.status = SwapchainStatus::Optimal;
        return r;
    case VK_SUBOPTIMAL_KHR:
        r.status = SwapchainStatus::Suboptimal;
        return r;
    case VK_ERROR_OUT_OF_DATE_KHR:
        r.status = SwapchainStatus::OutOfDate;
        return r;
    default:
        return vkError("acquire swapchain image", vr, "vkAcquireNextImageKHR failed");
    }
}

Result<SwapchainStatus> VulkanGpu::present(std::uint32_t imageIndex, VkSemaphore waitFor) {
    VkPresentInfoKHR pi{};
    pi.sType              = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    pi.waitSemaphoreCount = waitFor != VK_NULL_HANDLE ? 1 : 0;
    pi.pWaitSemaphores    = &waitFor;
    pi.swapchainCount     = 1;
    pi.pSwapchains        = &swapchain_;
    pi.pImageIndices      = &imageIndex;

    VkResult vr = vkQueuePresentKHR(queue_, &pi);
    switch (vr) {
    case VK_SUCCESS:              return SwapchainStatus::Optimal;
    case VK_SUBOPTIMAL_KHR:       return SwapchainStatus::Suboptimal;
    case VK_ERROR_OUT_OF_DATE_KHR: return SwapchainStatus::OutOfDate;
    default:
        return vkError("present", vr, "vkQueuePresentKHR failed");
    }
}

void VulkanGpu::destroySwapchainViews() {
    for (auto v : views_) {
        if (v != VK_NULL_HANDLE) vkDestroyImageView(device_, v, nullptr);
    }
    views_.clear();
}

Result<void> VulkanGpu::createSwapchain(VkExtent2D requested) {
    VkSurfaceCapabilitiesKHR caps;
    VkResult vr = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(physicalDevice_, surface_, &caps);
    if (vr != VK_SUCCESS) {
        return vkError("create swapchain", vr, "surface capabilities query failed");
    }

    if (format_ == VK_FORMAT_UNDEFINED) {
        std::uint32_t count = 0;
        vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice_, surface_, &count, nullptr);
        if (count == 0) return Error{"create swapchain", 0, "no surface formats available"};
        std::vector<VkSurfaceFormatKHR> formats(count);
        vkGetPhysicalDeviceSurfaceFormatsKHR(physicalDevice_, surface_, &count, formats.data());

        VkSurfaceFormatKHR chosen = formats[0];
        for (auto& f : formats) {
            if (f.format == VK_FORMAT_B8G8R8A8_SRGB &&
                f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR) {
                chosen = f;
                break;
            }
        }
        format_     = chosen.format;
        colorSpace_ = chosen.colorSpace;
    }

    VkExtent2D extent = caps.currentExtent;
    if (extent.width == UINT32_MAX) {
        extent.width  = std::clamp(requested.width, caps.minImageExtent.width,
                                   caps.maxImageExtent.width);
        extent.height = std::clamp(requested.height, caps.minImageExtent.height,
                                   caps.maxImageExtent.height);
    }
    if (extent.width == 0 || extent.height == 0) {
        return Error{"create swapchain", 0, "surface has no area"};
    }

    std::uint32_t imageCount = imageCountRequested_ != 0 ? imageCountRequested_
                                                         : caps.minImageCount + 1;
    imageCount = std::max(imageCount, caps.minImageCount);
    if (caps.maxImageCount > 0) imageCount = std::min(imageCount, caps.maxImageCount);

    VkSwapchainKHR oldSwapchain = swapchain_;

    VkSwapchainCreateInfoKHR ci{};
    ci.sType            = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    ci.surface          = surface_;
    ci.minImageCount    = imageCount;
    ci.imageFormat      = format_;
    ci.imageColorSpace  = colorSpace_;
    ci.imageExtent      = extent;
    ci.imageArrayLayers = 1;
    ci.imageUsage       = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    ci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    ci.preTransform     = caps.currentTransform;
    ci.compositeAlpha   = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    ci.presentMode      = presentMode_;
    ci.clipped          = VK_TRUE;
    ci.oldSwapchain     = oldSwapchain;

    VkSwapchainKHR created = VK_NULL_HANDLE;
    vr = vkCreateSwapchainKHR(device_, &ci, nullptr, &created);
    if (vr != VK_SUCCESS) {
        return vkError("create swapchain", vr, "vkCreateSwapchainKHR failed");
    }

    destroySwapchainViews();
    if (oldSwapchain != VK_NULL_HANDLE) vkDestroySwapchainKHR(device_, oldSwapchain, nullptr);
    swapchain_ = created;
    extent_    = extent;

    std::uint32_t count = 0;
    vkGetSwapchainImagesKHR(device_, swapchain_, &count, nullptr);
    images_.resize(count);
    vkGetSwapchainImagesKHR(device_, swapchain_, &count, images_.data());

    ImageDesc viewDesc;
    viewDesc.format = format_;
    viewDesc.aspect = VK_IMAGE_ASPECT_COLOR_BIT;
    views_.reserve(count);
    for (auto image : images_) {
        auto view = createView(image, viewDesc);
        if (!view.ok()) return view.error();
        views_.push_back(view.value());
    }
    return {};
}

Result<void> VulkanGpu::recreateSwapchain(VkExtent2D extent) {
    auto idle = waitIdle();
    if (!idle.ok()) return idle;
    return createSwapchain(extent);
}

Result<void> VulkanGpu::waitIdle() {
    VkResult vr = vkDeviceWaitIdle(device_);
    if (vr != VK_SUCCESS) return vkError("wait idle", vr, "vkDeviceWaitIdle failed");
    return {};
}

} // namespace vkframe
