#include "Geometry.hpp"

#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition)
    failures++;
}

static bool near(double a, double b) { return std::abs(a - b) < 1e-9; }

int main() {
  using regions::Rect;

  std::cout << "=== Test Rect construction ===" << std::endl;
  {
    Rect r(10, 20, 110, 70);
    check(near(r.width(), 100) && near(r.height(), 50), "width and height");
    check(near(r.area(), 5000), "area");
    check(near(r.center().x, 60) && near(r.center().y, 45), "center");

    bool threw = false;
    try {
      Rect bad(10, 0, 5, 10);
      (void)bad;
    } catch (const std::invalid_argument &) {
      threw = true;
    }
    check(threw, "x0 > x1 throws invalid_argument");

    check(!Rect::isWellFormed(0, 10, 10, 5), "y0 > y1 is malformed");
    check(!Rect::isWellFormed(std::nan(""), 0, 1, 1), "NaN is malformed");
    check(Rect::isWellFormed(5, 5, 5, 5), "zero size is well formed");

    Rect p = Rect::fromPoints(cv::Point2d(30, 40), cv::Point2d(10, 5));
    check(p == Rect(10, 5, 30, 40), "fromPoints orders corners");
  }

  std::cout << std::endl << "=== Test intersects / contains ===" << std::endl;
  {
    Rect a(0, 0, 100, 50);
    Rect touching(100, 0, 150, 50);
    Rect apart(105, 0, 150, 50);
    Rect inside(10, 10, 20, 20);

    check(a.intersects(touching), "shared edge intersects");
    check(!a.intersects(apart), "separate rects do not intersect");
    check(a.contains(inside), "contains inner rect");
    check(!inside.contains(a), "inner does not contain outer");
    check(a.contains(a), "contains itself");
    check(a.contains(cv::Point2d(100, 50)), "contains corner point");
    check(!a.contains(cv::Point2d(100.5, 25)), "point outside");
  }

  std::cout << std::endl << "=== Test distance ===" << std::endl;
  {
    Rect a(0, 0, 50, 50);
    Rect b(55, 0, 100, 50);
    Rect diagonal(53, 54, 60, 60);

    check(near(a.distanceTo(b), 5), "horizontal gap of 5");
    check(near(regions::distance(b, a), 5), "distance is symmetric");
    check(near(a.distanceTo(diagonal), 5), "diagonal gap 3-4-5");
    check(near(a.distanceTo(Rect(10, 10, 80, 80)), 0),
          "overlapping rects have distance 0");

    Rect touching(50, 20, 90, 30);
    check(a.intersects(touching) && near(a.distanceTo(touching), 0),
          "touching rects have distance 0");
    check(near(regions::distance(diagonal, a), a.distanceTo(diagonal)),
          "diagonal distance is symmetric");

    for (const Rect &r : {a, b, diagonal, Rect(7, 7, 7, 7)}) {
      check(near(r.distanceTo(r), 0), "distance to itself is 0");
    }
  }

  std::cout << std::endl << "=== Test union / intersection ===" << std::endl;
  {
    Rect a(0, 0, 50, 50);
    Rect b(55, 0, 100, 50);
    check(regions::unite(a, b) == Rect(0, 0, 100, 50), "union of neighbours");
    check(regions::unite(b, a) == regions::unite(a, b), "union is symmetric");
    check(regions::unite(a, a) == a && b.united(b) == b,
          "union with itself is unchanged");
    check(near(a.intersectionArea(Rect(25, 25, 75, 75)), 625),
          "intersection area");
    check(near(a.intersectionArea(b), 0), "disjoint intersection is 0");
  }

  std::cout << std::endl << "=== Test conversions ===" << std::endl;
  {
    Rect r(10, 20, 30, 60);
    check(r.scaled(2.0) == Rect(20, 40, 60, 120), "scaled by 2");
    check(r.expanded(5) == Rect(5, 15, 35, 65), "expanded by 5");

    cv::Rect2d cvRect = r.toCv();
    check(near(cvRect.x, 10) && near(cvRect.width, 20) &&
              near(cvRect.height, 40),
          "toCv uses x, y, width, height");
    check(Rect::fromCv(cvRect) == r, "fromCv restores bounds");

    cv::Rect pixels = Rect(-5.5, 10.2, 50.3, 300).toPixels(cv::Size(40, 200));
    check(pixels == cv::Rect(0, 10, 40, 190), "toPixels clips to image");

    std::ostringstream os;
    os << Rect(1, 2, 3, 4);
    check(os.str() == "(1, 2, 3, 4)", "stream output");
  }

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
