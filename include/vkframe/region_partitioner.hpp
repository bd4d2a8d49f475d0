#pragma once

#include <vkframe/gpu.hpp>
#include <vkframe/result.hpp>

#include <vulkan/vulkan.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace vkframe {

// A named slice to carve out of a shared buffer.
struct RegionSpec {
    std::string  name;
    VkDeviceSize size      = 0;
    VkDeviceSize alignment = 1;

    // Sized and aligned for one T.
    template <typename T>
    [[nodiscard]] static RegionSpec of(std::string name) {
        return RegionSpec{std::move(name), sizeof(T), alignof(T)};
    }
};

// A slice of the backing buffer. data points at offset inside the mapping
// when the buffer is host-visible, null otherwise.
struct RegionView {
    VkBuffer     handle = VK_NULL_HANDLE;
    VkDeviceSize offset = 0;
    VkDeviceSize length = 0;
    void*        data   = nullptr;
};

// Where every region lands. frames[i][slot] is per-frame region i for a slot.
struct RegionLayout {
    VkDeviceSize                         minAlign = 1;
    VkDeviceSize                         size     = 0;
    std::vector<RegionView>              globals;
    std::vector<std::vector<RegionView>> frames;
};

// Smallest offset alignment every sub-range of a buffer with this usage must
// honor on this device.
[[nodiscard]] VkDeviceSize minRegionAlignment(const DeviceLimits& limits,
                                              VkBufferUsageFlags usage);

// Lays out globals first in declaration order, then for each slot every
// per-frame region in declaration order. Pure: no GPU calls.
[[nodiscard]] RegionLayout computeLayout(const DeviceLimits& limits,
                                         VkBufferUsageFlags usage,
                                         const std::vector<RegionSpec>& globals,
                                         const std::vector<RegionSpec>& frames,
                                         std::uint32_t framesInFlight);

struct RegionPartitionOptions {
    std::string             name = "regions";
    VkBufferUsageFlags      usage = 0;
    bool                    hostVisible = true;
    std::vector<RegionSpec> globals;
    std::vector<RegionSpec> frames;
    std::uint32_t           framesInFlight = 2;
};

// One buffer, already sliced. Owns the buffer and its memory.
// Order frequently written regions in the order they are written to keep
// write-combined memory access sequential.
//
// Thread safety: immutable after creation; safe to read from any thread.
class PartitionedBuffer {
public:
    [[nodiscard]] static Result<PartitionedBuffer> create(Gpu& gpu,
                                                          const RegionPartitionOptions& options);

    ~PartitionedBuffer();
    PartitionedBuffer(PartitionedBuffer&&) noexcept;
    PartitionedBuffer& operator=(PartitionedBuffer&&) noexcept;
    PartitionedBuffer(const PartitionedBuffer&) = delete;
    PartitionedBuffer& operator=(const PartitionedBuffer&) = delete;

    [[nodiscard]] VkBuffer     vkBuffer() const { return buffer_.handle; }
    [[nodiscard]] VkDeviceSize size()     const { return layout_.size; }
    [[nodiscard]] void*        mapped()   const { return buffer_.mapped; }
    [[nodiscard]] const std::string&  name()   const { return name_; }
    [[nodiscard]] const RegionLayout& layout() const { return layout_; }

    [[nodiscard]] const RegionView& global(std::size_t index) const {
        return layout_.globals[index];
    }
    [[nodiscard]] const RegionView& frame(std::size_t index, std::uint32_t slot) const {
        return layout_.frames[index][slot];
    }

private:
    PartitionedBuffer() = default;
    void destroy();

    Gpu*             gpu_ = nullptr;
    std::string      name_;
    BufferAllocation buffer_;
    RegionLayout     layout_;
};

// Computes the layout, allocates one buffer of exactly layout.size bytes and
// stamps every view with its handle and mapping.
[[nodiscard]] inline Result<PartitionedBuffer> partition(Gpu& gpu,
                                                         const RegionPartitionOptions& options) {
    return PartitionedBuffer::create(gpu, options);
}

} // namespace vkframe
