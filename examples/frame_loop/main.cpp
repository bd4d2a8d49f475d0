#include <vkframe/vkframe.hpp>

#include <SDL3/SDL.h>
#include <vulkan/vulkan.h>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <utility>

// Clears the swapchain to a color that cycles over time, resizes render
// targets the way a game would, and paces frames for latency.

struct FrameConstants {
    float         time;
    float         delta;
    std::uint32_t frame;
    std::uint32_t pad;
};

static void recordFrame(VkCommandBuffer cmd, const vkframe::SwapchainImage& image, float t) {
    VkCommandBufferBeginInfo bi{};
    bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vkBeginCommandBuffer(cmd, &bi);

    VkRenderingAttachmentInfo color{};
    color.sType       = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
    color.imageView   = image.view;
    color.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
    color.loadOp      = VK_ATTACHMENT_LOAD_OP_CLEAR;
    color.storeOp     = VK_ATTACHMENT_STORE_OP_STORE;
    color.clearValue.color = {{0.5f + 0.5f * std::sin(t), 0.2f, 0.5f + 0.5f * std::cos(t), 1.0f}};

    VkRenderingInfo ri{};
    ri.sType                = VK_STRUCTURE_TYPE_RENDERING_INFO;
    ri.renderArea           = {{0, 0}, image.extent};
    ri.layerCount           = 1;
    ri.colorAttachmentCount = 1;
    ri.pColorAttachments    = &color;

    vkCmdBeginRendering(cmd, &ri);
    vkCmdEndRendering(cmd);

    vkEndCommandBuffer(cmd);
}

static VkExtent2D pixelSize(SDL_Window* window) {
    int w = 0;
    int h = 0;
    SDL_GetWindowSizeInPixels(window, &w, &h);
    return {static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h)};
}

static float displayRefreshRate(SDL_Window* window) {
    const SDL_DisplayMode* mode = SDL_GetCurrentDisplayMode(SDL_GetDisplayForWindow(window));
    return mode != nullptr ? mode->refresh_rate : 0.0f;
}

int main() {
    using Clock = std::chrono::steady_clock;

    vkframe::initializeLogLevelFromEnvironment();

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        vkframe::throwError({"initialize SDL", 0, SDL_GetError()});
    }
    SDL_Window* window = SDL_CreateWindow("vkframe - Frame Loop", 1280, 720,
                                          SDL_WINDOW_VULKAN | SDL_WINDOW_RESIZABLE);
    if (window == nullptr) {
        vkframe::throwError({"create window", 0, SDL_GetError()});
    }

    {
        auto gpu = vkframe::VulkanGpu::create(window).orThrow();

        vkframe::RegionPartitionOptions ro;
        ro.name        = "frame constants";
        ro.usage       = VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
        ro.hostVisible = true;
        ro.frames      = {vkframe::RegionSpec::of<FrameConstants>("constants")};
        auto constants = vkframe::partition(*gpu, ro).orThrow();

        vkframe::RenderTargetRegistryOptions rto;
        rto.physicalExtent = gpu->swapchainExtent();
        rto.allocator.name = "render targets";
        auto targets = vkframe::RenderTargetRegistry::create(*gpu, rto).orThrow();

        vkframe::RenderTargetDesc hdrDesc;
        hdrDesc.name         = "hdr";
        hdrDesc.image.format = VK_FORMAT_R16G16B16A16_SFLOAT;
        hdrDesc.image.extent = {1920, 1080, 1};
        hdrDesc.image.usage  = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
        auto hdr = targets.alloc(hdrDesc).orThrow();

        vkframe::RenderTargetDesc bloomDesc = hdrDesc;
        bloomDesc.name         = "bloom";
        bloomDesc.image.extent = {960, 540, 1};
        auto bloom = targets.alloc(bloomDesc).orThrow();

        targets.setListener([](vkframe::RenderTarget t, const vkframe::RenderTargetState& s) {
            vkframe::log(vkframe::LogLevel::Info, "render target %u is now %ux%u",
                         static_cast<unsigned>(t), s.extent.width, s.extent.height);
        });

        auto frames = vkframe::FrameScheduler::create(*gpu).orThrow();

        vkframe::FramePacerOptions po;
        po.refreshRateHz = displayRefreshRate(window);
        vkframe::FramePacer pacer(po);

        const Clock::time_point start = Clock::now();
        Clock::time_point lastResize  = start;
        bool running = true;

        while (running) {
            SDL_Event e;
            while (SDL_PollEvent(&e)) {
                switch (e.type) {
                case SDL_EVENT_QUIT:
                case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                    running = false;
                    break;
                case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
                    lastResize = Clock::now();
                    frames.markOutOfDate();
                    break;
                case SDL_EVENT_WINDOW_DISPLAY_CHANGED:
                    pacer.setRefreshRate(displayRefreshRate(window));
                    break;
                default:
                    break;
                }
            }

            VkExtent2D extent = pixelSize(window);
            if (extent.width == 0 || extent.height == 0) {
                SDL_Delay(16); // minimized
                continue;
            }

            if (targets.suboptimal(Clock::now() - lastResize, extent)) {
                frames.waitIdle().orThrow();
                targets.recreate(extent).orThrow();
            }

            pacer.sleep(frames.lastFrameBlocked());

            auto frame = frames.beginFrame().orThrow();

            const float t = std::chrono::duration<float>(Clock::now() - start).count();
            FrameConstants c{t, pacer.smoothedDeltaS(), static_cast<std::uint32_t>(frame.number), 0};
            std::memcpy(constants.frame(0, frame.slot).data, &c, sizeof(c));

            // Sampling both targets keeps them marked as used.
            (void)targets.get(hdr);
            (void)targets.get(bloom);

            auto image = frames.acquireImage(extent).orThrow();
            recordFrame(frame.cmd, image, t);
            frames.submit(frame.cmd).orThrow();

            // A dropped frame is survivable, a lost device is not.
            auto ended = frames.endFrame(true);
            if (!ended.ok()) {
                if (ended.error().fatal()) vkframe::throwError(ended.error());
                vkframe::log(vkframe::LogLevel::Warn, "%s", ended.error().format().c_str());
            }
        }

        frames.waitIdle().orThrow();
    }

    SDL_DestroyWindow(window);
    SDL_Quit();
    return 0;
}
