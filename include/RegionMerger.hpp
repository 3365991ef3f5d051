#ifndef REGIONS_REGION_MERGER_HPP
#define REGIONS_REGION_MERGER_HPP

#include "Geometry.hpp"
#include "RegionConfig.hpp"

#include <vector>

namespace regions {

/**
 * @brief Greedy single-pass clustering of rectangles
 *
 * Each incoming rectangle is compared with the merged rectangles in order. The
 * first one it intersects, or lies closer than threshold to, is replaced by
 * the union of both; otherwise the incoming rectangle starts a new cluster.
 *
 * Input order decides which cluster absorbs a rectangle. The pass is not a
 * fixed point: a cluster that grows late can come within threshold of an
 * earlier one, so running the pass again on its own output may merge further.
 *
 * @param rects Rectangles in page scan order
 * @param threshold Gap strictly below which rectangles merge
 * @return Merged rectangles, in order of cluster creation
 */
std::vector<Rect> mergeSinglePass(const std::vector<Rect> &rects,
                                  double threshold);

/**
 * @brief Repeat mergeSinglePass until no further merge happens
 *
 * The result has no pair of rectangles closer than threshold.
 */
std::vector<Rect> mergeToFixedPoint(const std::vector<Rect> &rects,
                                    double threshold);

/**
 * @brief Merge with the given mode
 */
std::vector<Rect> mergeRegions(const std::vector<Rect> &rects,
                               double threshold, MergeMode mode);

/**
 * @brief Whether two rectangles would merge under threshold
 */
bool isMergeable(const Rect &a, const Rect &b, double threshold);

} // namespace regions

#endif // REGIONS_REGION_MERGER_HPP
