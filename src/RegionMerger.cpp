#include "RegionMerger.hpp"

#include <utility>

namespace regions {

bool isMergeable(const Rect &a, const Rect &b, double threshold) {
  return a.intersects(b) || a.distanceTo(b) < threshold;
}

std::vector<Rect> mergeSinglePass(const std::vector<Rect> &rects,
                                  double threshold) {
  std::vector<Rect> merged;
  merged.reserve(rects.size());

  for (const auto &rect : rects) {
    bool added = false;
    for (auto &cluster : merged) {
      if (isMergeable(rect, cluster, threshold)) {
        cluster = cluster.united(rect);
        added = true;
        break; // first match wins
      }
    }
    if (!added) {
      merged.push_back(rect);
    }
  }

  return merged;
}

std::vector<Rect> mergeToFixedPoint(const std::vector<Rect> &rects,
                                    double threshold) {
  std::vector<Rect> current = mergeSinglePass(rects, threshold);

  // A pass without merges returns its input unchanged, and every merge
  // removes one rectangle, so the count decreasing is the only progress
  while (true) {
    std::vector<Rect> next = mergeSinglePass(current, threshold);
    if (next.size() == current.size()) {
      return next;
    }
    current = std::move(next);
  }
}

std::vector<Rect> mergeRegions(const std::vector<Rect> &rects,
                               double threshold, MergeMode mode) {
  switch (mode) {
  case MergeMode::FixedPoint:
    return mergeToFixedPoint(rects, threshold);
  case MergeMode::SinglePass:
  default:
    return mergeSinglePass(rects, threshold);
  }
}

} // namespace regions
