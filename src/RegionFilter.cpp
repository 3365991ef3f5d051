#include "RegionFilter.hpp"

#include <algorithm>
#include <numeric>

namespace regions {

namespace {

std::vector<Rect> pick(const std::vector<Rect> &rects,
                       const std::vector<std::size_t> &indices) {
  std::vector<Rect> result;
  result.reserve(indices.size());
  for (std::size_t index : indices) {
    result.push_back(rects[index]);
  }
  return result;
}

} // anonymous namespace

bool covers(const Rect &outer, const Rect &inner, double threshold) {
  if (threshold >= 1.0 || inner.area() <= 0.0) {
    return outer.contains(inner);
  }
  return outer.intersectionArea(inner) / inner.area() >= threshold;
}

std::vector<std::size_t>
selectInnerRegions(const std::vector<Rect> &rects,
                   double containmentThreshold) {
  std::vector<std::size_t> kept;

  for (std::size_t i = 0; i < rects.size(); i++) {
    bool isOuter = false;

    for (std::size_t j = 0; j < rects.size(); j++) {
      if (i == j || !covers(rects[i], rects[j], containmentThreshold)) {
        continue;
      }

      // Mutual coverage: the earlier region stands in for both
      bool mutual = covers(rects[j], rects[i], containmentThreshold);
      if (mutual && j > i) {
        continue;
      }

      isOuter = true;
      break;
    }

    if (!isOuter) {
      kept.push_back(i);
    }
  }

  return kept;
}

std::vector<Rect> removeOuterRegions(const std::vector<Rect> &rects) {
  return pick(rects, selectInnerRegions(rects));
}

std::vector<std::size_t> selectBySize(const std::vector<Rect> &rects,
                                      double minRatio) {
  if (rects.empty()) {
    return {};
  }

  std::vector<std::size_t> order(rects.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&rects](std::size_t a, std::size_t b) {
                     return rects[a].area() > rects[b].area();
                   });

  double largestArea = rects[order.front()].area();
  std::vector<std::size_t> kept = {order.front()};

  for (std::size_t k = 1; k < order.size(); k++) {
    const Rect &rect = rects[order[k]];

    bool largeEnough = rect.area() >= minRatio * largestArea;
    bool insideKept = std::any_of(
        kept.begin(), kept.end(),
        [&](std::size_t index) { return rects[index].contains(rect); });

    if (largeEnough || !insideKept) {
      kept.push_back(order[k]);
    }
  }

  std::sort(kept.begin(), kept.end());
  return kept;
}

std::vector<Rect> filterBySize(const std::vector<Rect> &rects,
                               double minRatio) {
  return pick(rects, selectBySize(rects, minRatio));
}

} // namespace regions
