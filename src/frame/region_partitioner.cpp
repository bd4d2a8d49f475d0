#include <vkframe/region_partitioner.hpp>
#include <vkframe/log.hpp>

#include <algorithm>
#include <utility>

namespace vkframe {

static VkDeviceSize alignUp(VkDeviceSize value, VkDeviceSize alignment) {
    if (alignment <= 1) return value;
    return (value + alignment - 1) / alignment * alignment;
}

VkDeviceSize minRegionAlignment(const DeviceLimits& limits, VkBufferUsageFlags usage) {
    VkDeviceSize align = 1;
    if (usage & (VK_BUFFER_USAGE_TRANSFER_SRC_BIT | VK_BUFFER_USAGE_TRANSFER_DST_BIT)) {
        align = std::max(align, limits.bufferCopyOffsetAlignment);
    }
    if (usage & (VK_BUFFER_USAGE_UNIFORM_TEXEL_BUFFER_BIT |
                 VK_BUFFER_USAGE_STORAGE_TEXEL_BUFFER_BIT)) {
        align = std::max(align, limits.texelBufferOffsetAlignment);
    }
    if (usage & VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT) {
        align = std::max(align, limits.uniformBufferOffsetAlignment);
    }
    if (usage & VK_BUFFER_USAGE_STORAGE_BUFFER_BIT) {
        align = std::max(align, limits.storageBufferOffsetAlignment);
    }
    // Vulkan only constrains the offsets used with these; align to the
    // element size so any sub-range is a valid draw/index source.
    if (usage & VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT) {
        align = std::max<VkDeviceSize>(align, 4);
    }
    if (usage & VK_BUFFER_USAGE_INDEX_BUFFER_BIT) {
        align = std::max<VkDeviceSize>(align, 2);
    }
    return align;
}

RegionLayout computeLayout(const DeviceLimits& limits,
                           VkBufferUsageFlags usage,
                           const std::vector<RegionSpec>& globals,
                           const std::vector<RegionSpec>& frames,
                           std::uint32_t framesInFlight) {
    RegionLayout layout;
    layout.minAlign = minRegionAlignment(limits, usage);

    VkDeviceSize offset = 0;
    auto place = [&](const RegionSpec& spec) {
        offset = alignUp(offset, std::max(layout.minAlign, spec.alignment));
        RegionView view;
        view.offset = offset;
        view.length = spec.size;
        offset += spec.size;
        return view;
    };

    layout.globals.reserve(globals.size());
    for (const auto& spec : globals) {
        layout.globals.push_back(place(spec));
    }

    layout.frames.assign(frames.size(), std::vector<RegionView>(framesInFlight));
    for (std::uint32_t slot = 0; slot < framesInFlight; ++slot) {
        for (std::size_t i = 0; i < frames.size(); ++i) {
            layout.frames[i][slot] = place(frames[i]);
        }
    }

    layout.size = offset;
    return layout;
}

static void stamp(RegionView& view, const BufferAllocation& buffer) {
    view.handle = buffer.handle;
    view.data   = buffer.mapped != nullptr
                      ? static_cast<void*>(static_cast<char*>(buffer.mapped) + view.offset)
                      : nullptr;
}

Result<PartitionedBuffer> PartitionedBuffer::create(Gpu& gpu,
                                                    const RegionPartitionOptions& options) {
    if (options.framesInFlight == 0) {
        return Error{"partition buffer \"" + options.name + "\"", 0,
                     "framesInFlight must be at least 1"};
    }

    RegionLayout layout = computeLayout(gpu.limits(), options.usage, options.globals,
                                        options.frames, options.framesInFlight);
    if (layout.size == 0) {
        return Error{"partition buffer \"" + options.name + "\"", 0,
                     "no regions, or every region is empty"};
    }

    BufferDesc desc;
    desc.size        = layout.size;
    desc.usage       = options.usage;
    desc.hostVisible = options.hostVisible;
    auto buffer = gpu.createBuffer(desc);
    if (!buffer.ok()) return buffer.error();

    for (auto& view : layout.globals) {
        stamp(view, buffer.value());
    }
    for (auto& slots : layout.frames) {
        for (auto& view : slots) {
            stamp(view, buffer.value());
        }
    }

    log(LogLevel::Debug, "partitioned \"%s\": %zu global + %zu per-frame regions, %llu bytes",
        options.name.c_str(), options.globals.size(), options.frames.size(),
        static_cast<unsigned long long>(layout.size));

    PartitionedBuffer pb;
    pb.gpu_    = &gpu;
    pb.name_   = options.name;
    pb.buffer_ = buffer.value();
    pb.layout_ = std::move(layout);
    return pb;
}

PartitionedBuffer::~PartitionedBuffer() { destroy(); }

void PartitionedBuffer::destroy() {
    if (gpu_ == nullptr) return;
    gpu_->destroyBuffer(buffer_.handle);
    gpu_->freeMemory(buffer_.memory);
    buffer_ = {};
    gpu_ = nullptr;
}

PartitionedBuffer::PartitionedBuffer(PartitionedBuffer&& o) noexcept
    : gpu_(o.gpu_), name_(std::move(o.name_)), buffer_(o.buffer_),
      layout_(std::move(o.layout_)) {
    o.gpu_    = nullptr;
    o.buffer_ = {};
}

PartitionedBuffer& PartitionedBuffer::operator=(PartitionedBuffer&& o) noexcept {
    if (this != &o) {
        destroy();
        gpu_    = o.gpu_;
        name_   = std::move(o.name_);
        buffer_ = o.buffer_;
        layout_ = std::move(o.layout_);
        o.gpu_    = nullptr;
        o.buffer_ = {};
    }
    return *this;
}

} // namespace vkframe
