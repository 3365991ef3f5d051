#include "RegionMerger.hpp"

#include <iostream>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition)
    failures++;
}

using namespace regions;

int main() {
  std::cout << "=== Test mergeSinglePass ===" << std::endl;
  {
    auto merged = mergeSinglePass({Rect(0, 0, 50, 50), Rect(55, 0, 100, 50)},
                                  40);
    check(merged.size() == 1 && merged[0] == Rect(0, 0, 100, 50),
          "gap of 5 merges into (0, 0, 100, 50)");

    merged = mergeSinglePass({Rect(0, 0, 50, 50), Rect(70, 0, 100, 50)}, 10);
    check(merged.size() == 2, "gap of 20 stays separate at threshold 10");

    merged = mergeSinglePass({Rect(0, 0, 50, 50), Rect(90, 0, 100, 50)}, 40);
    check(merged.size() == 2, "gap equal to the threshold does not merge");

    merged = mergeSinglePass({Rect(0, 0, 50, 50), Rect(20, 20, 80, 80)}, 0);
    check(merged.size() == 1, "overlapping rects merge at threshold 0");

    check(mergeSinglePass({}, 40).empty(), "empty input");
  }

  std::cout << std::endl << "=== Test merge order ===" << std::endl;
  {
    // The third rect is near both clusters; the first cluster absorbs it
    std::vector<Rect> rects = {Rect(0, 0, 10, 10), Rect(100, 0, 110, 10),
                               Rect(40, 0, 70, 10)};
    auto merged = mergeSinglePass(rects, 40);
    check(merged.size() == 2, "single pass leaves two clusters");
    check(merged[0] == Rect(0, 0, 70, 10), "first cluster absorbs the middle");
    check(merged[1] == Rect(100, 0, 110, 10), "second cluster unchanged");
  }

  std::cout << std::endl << "=== Test idempotence ===" << std::endl;
  {
    std::vector<Rect> apart = {Rect(0, 0, 10, 10), Rect(100, 0, 110, 10),
                               Rect(0, 100, 10, 110)};
    auto once = mergeSinglePass(apart, 40);
    auto twice = mergeSinglePass(once, 40);
    check(once == apart, "non-mergeable input is returned unchanged");
    check(twice == once, "second pass changes nothing");
  }

  std::cout << std::endl << "=== Test fixed point ===" << std::endl;
  {
    // After the first pass (0,0,70,10) and (100,0,110,10) are 30 apart
    std::vector<Rect> rects = {Rect(0, 0, 10, 10), Rect(100, 0, 110, 10),
                               Rect(40, 0, 70, 10)};
    auto single = mergeRegions(rects, 40, MergeMode::SinglePass);
    auto fixed = mergeRegions(rects, 40, MergeMode::FixedPoint);

    check(single.size() == 2, "single pass stops after one pass");
    check(fixed.size() == 1 && fixed[0] == Rect(0, 0, 110, 10),
          "fixed point merges the remaining pair");

    auto again = mergeToFixedPoint(fixed, 40);
    check(again == fixed, "fixed point result is stable");

    for (size_t i = 0; i < single.size(); i++) {
      for (size_t j = i + 1; j < single.size(); j++) {
        check(isMergeable(single[i], single[j], 40),
              "single pass may leave mergeable pairs");
      }
    }
  }

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
