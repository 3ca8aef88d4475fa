#include "voxel.h"

#include <algorithm>

VoxelChunk::VoxelChunk()
    : voxels(static_cast<std::size_t>(kChunkVoxelCount), 0u)
{
}

bool VoxelChunk::isEmpty() const noexcept
{
    return std::none_of(voxels.begin(), voxels.end(), [](std::uint32_t voxel) { return isSolidVoxel(voxel); });
}

std::size_t VoxelChunk::solidCount() const noexcept
{
    return static_cast<std::size_t>(
        std::count_if(voxels.begin(), voxels.end(), [](std::uint32_t voxel) { return isSolidVoxel(voxel); }));
}

std::uint64_t VoxelChunk::occupancyMask() const noexcept
{
    std::uint64_t mask = 0;
    for (int z = 0; z < kChunkSize; ++z)
    {
        for (int y = 0; y < kChunkSize; ++y)
        {
            for (int x = 0; x < kChunkSize; ++x)
            {
                if (!isSolidVoxel(at(x, y, z)))
                {
                    continue;
                }
                const int bit = subRegionBit(x / kSubRegionSize, y / kSubRegionSize, z / kSubRegionSize);
                mask |= std::uint64_t{1} << bit;
            }
        }
    }
    return mask;
}
