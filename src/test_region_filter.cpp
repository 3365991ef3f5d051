#include "RegionFilter.hpp"

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
  std::cout << "=== Test removeOuterRegions ===" << std::endl;
  {
    Rect a(0, 0, 100, 100);
    Rect b(10, 10, 20, 20);

    auto inner = removeOuterRegions({a, b});
    check(inner.size() == 1 && inner[0] == b, "container is dropped");

    inner = removeOuterRegions({b, a});
    check(inner.size() == 1 && inner[0] == b, "order does not matter");

    Rect c(200, 0, 300, 100);
    inner = removeOuterRegions({a, c});
    check(inner.size() == 2, "disjoint regions are kept");

    inner = removeOuterRegions({a, a});
    check(inner.size() == 1, "one of two duplicates is kept");

    auto indices = selectInnerRegions({a, b, Rect(30, 30, 40, 40)});
    check(indices == std::vector<std::size_t>({1, 2}),
          "all inner regions survive one container");

    check(removeOuterRegions({}).empty(), "empty input");
  }

  std::cout << std::endl << "=== Test coverage threshold ===" << std::endl;
  {
    Rect outer(0, 0, 100, 100);
    Rect half(50, 0, 150, 100);

    check(!covers(outer, half, 1.0), "half overlap is not containment");
    check(covers(outer, half, 0.5), "half overlap covers at 0.5");
    check(!covers(outer, half, 0.6), "half overlap fails at 0.6");

    auto kept = selectInnerRegions({outer, half}, 0.5);
    check(kept == std::vector<std::size_t>({0}),
          "mutual coverage keeps the first region");
  }

  std::cout << std::endl << "=== Test filterBySize ===" << std::endl;
  {
    // Areas 100, 60 and 5; the small one lies inside the largest
    Rect large(0, 0, 10, 10);
    Rect medium(20, 0, 26, 10);
    Rect tiny(1, 1, 6, 2);

    auto kept = filterBySize({large, medium, tiny}, 0.5);
    check(kept.size() == 2, "tiny contained region is dropped");
    check(kept.size() == 2 && kept[0] == large && kept[1] == medium,
          "order is preserved");

    Rect farSmall(50, 50, 55, 51);
    kept = filterBySize({large, farSmall}, 0.5);
    check(kept.size() == 2, "small region outside the large one is kept");

    kept = filterBySize({tiny, large}, 0.5);
    check(kept.size() == 1 && kept[0] == large,
          "result follows input order when the large region comes last");

    check(filterBySize({large, tiny}, 0.0).size() == 2,
          "ratio 0 keeps everything");
    check(filterBySize({}, 0.5).empty(), "empty input");
  }

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
