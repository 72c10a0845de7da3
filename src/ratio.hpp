#pragma once

/**
 * Ratio-based flexible sizing.
 *
 * Shared by table column sizing and layout region splitting: items either
 * have a fixed size or take a share of the remaining space proportional to
 * their ratio, never dropping below their minimum unless the minimums alone
 * exceed the total.
 */

#include <cstddef>
#include <optional>
#include <vector>

namespace rich {

struct SizeSpec {
    size_t minimum_size = 1;
    std::optional<size_t> size;  // Fixed size; flexible when unset.
    size_t ratio = 1;

    static SizeSpec fixed(size_t size, size_t minimum = 1) {
        SizeSpec spec;
        spec.size = size;
        spec.minimum_size = minimum;
        return spec;
    }

    static SizeSpec flexible(size_t ratio = 1, size_t minimum = 1) {
        SizeSpec spec;
        spec.ratio = ratio;
        spec.minimum_size = minimum;
        return spec;
    }
};

/**
 * Resolve item sizes for `total` cells.
 *
 * Fixed items take their size (at least their minimum), flexible items start
 * at their minimum and share what is left by ratio. The last flexible item
 * absorbs the rounding remainder. When the result exceeds the total, sizes
 * shrink proportionally to how far each is above its minimum, then one cell
 * at a time from the last item, then (if minimums alone overflow) round-robin
 * from the first item.
 *
 * The sum never exceeds `total`, and equals it whenever the minimums fit.
 */
std::vector<size_t> ratio_resolve(size_t total, const std::vector<SizeSpec>& items);

/**
 * Distribute `total` by `ratios`, each share rounded up and at least its
 * minimum. Used to expand table columns.
 */
std::vector<size_t> ratio_distribute(size_t total, const std::vector<size_t>& ratios,
                                     const std::vector<size_t>& minimums = {});

struct Region {
    size_t x = 0;
    size_t y = 0;
    size_t width = 0;
    size_t height = 0;

    bool operator==(const Region& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

// Split a region into side-by-side children, left to right.
std::vector<Region> divide_row(const Region& region, const std::vector<SizeSpec>& items);

// Split a region into stacked children, top to bottom.
std::vector<Region> divide_column(const Region& region, const std::vector<SizeSpec>& items);

} // namespace rich
