#pragma once

// Core (no GPU, no window)
#include <vkframe/error.hpp>
#include <vkframe/log.hpp>
#include <vkframe/result.hpp>
#include <vkframe/gpu.hpp>

// Frame lifecycle and allocation
#include <vkframe/deferred_deleter.hpp>
#include <vkframe/frame_pacer.hpp>
#include <vkframe/frame_scheduler.hpp>
#include <vkframe/page_allocator.hpp>
#include <vkframe/region_partitioner.hpp>
#include <vkframe/render_target_registry.hpp>

// Vulkan + SDL3 backend
#include <vkframe/vulkan_gpu.hpp>
