#include "ratio.hpp"

#include <algorithm>
#include <numeric>

namespace rich {

namespace {
    size_t sum(const std::vector<size_t>& values) {
        return std::accumulate(values.begin(), values.end(), size_t(0));
    }

    // Round ratio * remaining / total_ratio to nearest, halves away from zero.
    size_t rounded_share(size_t ratio, size_t remaining, size_t total_ratio) {
        return (2 * ratio * remaining + total_ratio) / (2 * total_ratio);
    }

    void shrink_to_total(std::vector<size_t>& sizes, const std::vector<size_t>& mins, size_t total) {
        size_t current = sum(sizes);
        if (current <= total) {
            return;
        }

        // Proportional to how far each item sits above its minimum
        size_t excess = current - total;
        size_t shrinkable_total = 0;
        for (size_t i = 0; i < sizes.size(); i++) {
            shrinkable_total += sizes[i] - mins[i];
        }
        if (shrinkable_total > 0) {
            for (size_t i = 0; i < sizes.size(); i++) {
                size_t shrinkable = sizes[i] - mins[i];
                size_t reduce = std::min(shrinkable, excess * shrinkable / shrinkable_total);
                sizes[i] -= reduce;
                current -= reduce;
            }
        }

        // One cell at a time from the last items
        while (current > total) {
            bool reduced = false;
            for (size_t i = sizes.size(); i-- > 0;) {
                if (sizes[i] > mins[i]) {
                    sizes[i]--;
                    current--;
                    reduced = true;
                    if (current == total) {
                        break;
                    }
                }
            }
            if (!reduced) {
                break;
            }
        }

        // Minimums alone overflow
        size_t i = 0;
        while (current > total) {
            if (sizes[i] > 0) {
                sizes[i]--;
                current--;
            }
            i = (i + 1) % sizes.size();
        }
    }

    std::vector<Region> divide(const Region& region, const std::vector<SizeSpec>& items, bool horizontal) {
        std::vector<size_t> sizes = ratio_resolve(horizontal ? region.width : region.height, items);
        std::vector<Region> regions;
        regions.reserve(sizes.size());

        size_t offset = 0;
        for (size_t size : sizes) {
            if (horizontal) {
                regions.push_back(Region{region.x + offset, region.y, size, region.height});
            } else {
                regions.push_back(Region{region.x, region.y + offset, region.width, size});
            }
            offset += size;
        }
        return regions;
    }
}

std::vector<size_t> ratio_resolve(size_t total, const std::vector<SizeSpec>& items) {
    if (items.empty()) {
        return {};
    }

    std::vector<size_t> sizes;
    std::vector<size_t> mins;
    std::vector<size_t> ratios;
    size_t fixed_total = 0;
    size_t flex_min_total = 0;

    for (const auto& item : items) {
        size_t minimum = std::max<size_t>(item.minimum_size, 1);
        mins.push_back(minimum);
        if (item.size) {
            size_t size = std::max(*item.size, minimum);
            sizes.push_back(size);
            ratios.push_back(0);
            fixed_total += size;
        } else {
            sizes.push_back(minimum);
            ratios.push_back(std::max<size_t>(item.ratio, 1));
            flex_min_total += minimum;
        }
    }

    size_t used = fixed_total + flex_min_total;
    size_t remaining = total > used ? total - used : 0;
    size_t total_ratio = sum(ratios);

    if (total_ratio > 0 && remaining > 0) {
        size_t flex_count = static_cast<size_t>(
            std::count_if(ratios.begin(), ratios.end(), [](size_t r) { return r > 0; }));
        size_t flex_index = 0;
        size_t distributed = 0;
        for (size_t i = 0; i < ratios.size(); i++) {
            if (ratios[i] == 0) {
                continue;
            }
            flex_index++;
            size_t extra = flex_index == flex_count
                               ? remaining - distributed
                               : rounded_share(ratios[i], remaining, total_ratio);
            // Rounding up earlier shares can overshoot; the last item never goes negative
            extra = std::min(extra, remaining - distributed);
            sizes[i] += extra;
            distributed += extra;
        }
        remaining -= distributed;
    }

    for (size_t i = 0; remaining > 0; i = (i + 1) % sizes.size()) {
        sizes[i]++;
        remaining--;
    }

    shrink_to_total(sizes, mins, total);
    return sizes;
}

std::vector<size_t> ratio_distribute(size_t total, const std::vector<size_t>& ratios,
                                     const std::vector<size_t>& minimums) {
    size_t total_ratio = sum(ratios);
    size_t total_remaining = total;
    std::vector<size_t> distributed;
    distributed.reserve(ratios.size());

    for (size_t i = 0; i < ratios.size(); i++) {
        size_t minimum = i < minimums.size() ? minimums[i] : 0;
        size_t share;
        if (total_ratio > 0) {
            share = std::max(minimum, (ratios[i] * total_remaining + total_ratio - 1) / total_ratio);
        } else {
            share = total_remaining;
        }
        distributed.push_back(share);
        total_ratio -= ratios[i];
        total_remaining = total_remaining > share ? total_remaining - share : 0;
    }

    return distributed;
}

std::vector<Region> divide_row(const Region& region, const std::vector<SizeSpec>& items) {
    return divide(region, items, true);
}

std::vector<Region> divide_column(const Region& region, const std::vector<SizeSpec>& items) {
    return divide(region, items, false);
}

} // namespace rich
