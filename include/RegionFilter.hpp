#ifndef REGIONS_REGION_FILTER_HPP
#define REGIONS_REGION_FILTER_HPP

#include "Geometry.hpp"

#include <cstddef>
#include <vector>

namespace regions {

/**
 * @brief Whether outer covers inner under a containment threshold
 *
 * With a threshold of 1.0 (or more) this is plain full containment. Below 1.0,
 * outer covers inner when at least that fraction of inner's area lies inside
 * outer. Zero-area rectangles always fall back to full containment.
 */
bool covers(const Rect &outer, const Rect &inner, double threshold = 1.0);

/**
 * @brief Indices of the regions that do not cover any other region
 *
 * A region covering another one is an outer region and is dropped. When two
 * regions cover each other (equal rectangles) only the later one is dropped,
 * so duplicates keep their first occurrence.
 *
 * @param rects Regions in page scan order
 * @param containmentThreshold See covers()
 * @return Indices of kept regions, ascending
 */
std::vector<std::size_t>
selectInnerRegions(const std::vector<Rect> &rects,
                   double containmentThreshold = 1.0);

/**
 * @brief Drop regions that fully contain another region
 */
std::vector<Rect> removeOuterRegions(const std::vector<Rect> &rects);

/**
 * @brief Indices of the regions surviving the size-ratio filter
 *
 * Regions are visited by decreasing area. The largest is kept; a later one is
 * kept when its area reaches minRatio of the largest, or when no region kept
 * so far contains it. Small but distinct regions survive, small slivers inside
 * a kept region are dropped.
 *
 * @return Indices of kept regions, ascending
 */
std::vector<std::size_t> selectBySize(const std::vector<Rect> &rects,
                                      double minRatio);

/**
 * @brief Apply the size-ratio filter, preserving input order
 */
std::vector<Rect> filterBySize(const std::vector<Rect> &rects,
                               double minRatio);

} // namespace regions

#endif // REGIONS_REGION_FILTER_HPP
