#ifndef REGIONS_GEOMETRY_HPP
#define REGIONS_GEOMETRY_HPP

#include <opencv2/core.hpp>

#include <ostream>

namespace regions {

/**
 * @brief Axis-aligned rectangle in page coordinates
 *
 * Bounds are (x0, y0) top-left and (x1, y1) bottom-right with the origin at the
 * top-left of the page and y increasing downward. A rectangle always satisfies
 * x0 <= x1 and y0 <= y1; zero width or height is allowed (a line's bounding
 * box), inverted bounds are rejected.
 *
 * All edges are inclusive: rectangles that share an edge intersect, and a point
 * on the boundary is contained.
 */
class Rect {
public:
  /**
   * @brief Empty rectangle at the origin
   */
  Rect() = default;

  /**
   * @brief Construct from bounds
   * @throws std::invalid_argument if x0 > x1, y0 > y1 or a bound is NaN
   */
  Rect(double x0, double y0, double x1, double y1);

  /**
   * @brief Check bounds without constructing
   * @return true if Rect(x0, y0, x1, y1) would succeed
   */
  static bool isWellFormed(double x0, double y0, double x1, double y1);

  /**
   * @brief Smallest rectangle covering two points given in any order
   */
  static Rect fromPoints(const cv::Point2d &a, const cv::Point2d &b);

  /**
   * @brief Convert from an OpenCV rectangle (x, y, width, height)
   * @throws std::invalid_argument on negative width or height
   */
  static Rect fromCv(const cv::Rect2d &rect);

  double x0() const { return m_x0; }
  double y0() const { return m_y0; }
  double x1() const { return m_x1; }
  double y1() const { return m_y1; }

  double width() const { return m_x1 - m_x0; }
  double height() const { return m_y1 - m_y0; }
  double area() const { return width() * height(); }

  cv::Point2d topLeft() const { return cv::Point2d(m_x0, m_y0); }
  cv::Point2d bottomRight() const { return cv::Point2d(m_x1, m_y1); }
  cv::Point2d center() const;

  /**
   * @brief True if the rectangles overlap or touch
   */
  bool intersects(const Rect &other) const;

  /**
   * @brief True if the point lies inside or on the boundary
   */
  bool contains(const cv::Point2d &point) const;

  /**
   * @brief True if every corner of other lies inside or on the boundary
   */
  bool contains(const Rect &other) const;

  /**
   * @brief Tight bounding box of both rectangles
   */
  Rect united(const Rect &other) const;

  /**
   * @brief Euclidean gap between the closest edges
   *
   * The horizontal and vertical gaps are each clamped to zero, so the result is
   * 0 when the rectangles intersect or touch and the corner-to-corner distance
   * when they are diagonally apart.
   */
  double distanceTo(const Rect &other) const;

  /**
   * @brief Area of the overlap, 0 if disjoint
   */
  double intersectionArea(const Rect &other) const;

  /**
   * @brief Scale all bounds by a factor (e.g. points to pixels)
   */
  Rect scaled(double factor) const;

  /**
   * @brief Grow by padding on every side
   */
  Rect expanded(double padding) const;

  cv::Rect2d toCv() const;

  /**
   * @brief Integer pixel rectangle covering this one, clipped to an image
   * @param imageSize Size of the target image
   * @return Clipped rectangle, empty if there is no overlap
   */
  cv::Rect toPixels(const cv::Size &imageSize) const;

  bool operator==(const Rect &other) const;
  bool operator!=(const Rect &other) const { return !(*this == other); }

private:
  double m_x0 = 0.0;
  double m_y0 = 0.0;
  double m_x1 = 0.0;
  double m_y1 = 0.0;
};

double distance(const Rect &a, const Rect &b);

Rect unite(const Rect &a, const Rect &b);

std::ostream &operator<<(std::ostream &os, const Rect &rect);

} // namespace regions

#endif // REGIONS_GEOMETRY_HPP
