#include "Geometry.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace regions {

Rect::Rect(double x0, double y0, double x1, double y1)
    : m_x0(x0), m_y0(y0), m_x1(x1), m_y1(y1) {
  if (!isWellFormed(x0, y0, x1, y1)) {
    std::ostringstream msg;
    msg << "Malformed rectangle (" << x0 << ", " << y0 << ", " << x1 << ", "
        << y1 << ")";
    throw std::invalid_argument(msg.str());
  }
}

bool Rect::isWellFormed(double x0, double y0, double x1, double y1) {
  // Comparisons against NaN are false, so NaN bounds are rejected too
  return x0 <= x1 && y0 <= y1;
}

Rect Rect::fromPoints(const cv::Point2d &a, const cv::Point2d &b) {
  return Rect(std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x),
              std::max(a.y, b.y));
}

Rect Rect::fromCv(const cv::Rect2d &rect) {
  return Rect(rect.x, rect.y, rect.x + rect.width, rect.y + rect.height);
}

cv::Point2d Rect::center() const {
  return cv::Point2d((m_x0 + m_x1) / 2.0, (m_y0 + m_y1) / 2.0);
}

bool Rect::intersects(const Rect &other) const {
  return m_x0 <= other.m_x1 && other.m_x0 <= m_x1 && m_y0 <= other.m_y1 &&
         other.m_y0 <= m_y1;
}

bool Rect::contains(const cv::Point2d &point) const {
  return point.x >= m_x0 && point.x <= m_x1 && point.y >= m_y0 &&
         point.y <= m_y1;
}

bool Rect::contains(const Rect &other) const {
  return other.m_x0 >= m_x0 && other.m_x1 <= m_x1 && other.m_y0 >= m_y0 &&
         other.m_y1 <= m_y1;
}

Rect Rect::united(const Rect &other) const {
  Rect result;
  result.m_x0 = std::min(m_x0, other.m_x0);
  result.m_y0 = std::min(m_y0, other.m_y0);
  result.m_x1 = std::max(m_x1, other.m_x1);
  result.m_y1 = std::max(m_y1, other.m_y1);
  return result;
}

double Rect::distanceTo(const Rect &other) const {
  if (intersects(other)) {
    return 0.0;
  }

  double dx = std::max({other.m_x0 - m_x1, m_x0 - other.m_x1, 0.0});
  double dy = std::max({other.m_y0 - m_y1, m_y0 - other.m_y1, 0.0});
  return std::sqrt(dx * dx + dy * dy);
}

double Rect::intersectionArea(const Rect &other) const {
  double w = std::min(m_x1, other.m_x1) - std::max(m_x0, other.m_x0);
  double h = std::min(m_y1, other.m_y1) - std::max(m_y0, other.m_y0);
  if (w <= 0.0 || h <= 0.0) {
    return 0.0;
  }
  return w * h;
}

Rect Rect::scaled(double factor) const {
  return Rect::fromPoints(cv::Point2d(m_x0 * factor, m_y0 * factor),
                          cv::Point2d(m_x1 * factor, m_y1 * factor));
}

Rect Rect::expanded(double padding) const {
  Rect result = *this;
  result.m_x0 -= padding;
  result.m_y0 -= padding;
  result.m_x1 += padding;
  result.m_y1 += padding;
  if (!isWellFormed(result.m_x0, result.m_y0, result.m_x1, result.m_y1)) {
    // Negative padding larger than half the size collapses to the center
    cv::Point2d c = center();
    return Rect(c.x, c.y, c.x, c.y);
  }
  return result;
}

cv::Rect2d Rect::toCv() const {
  return cv::Rect2d(m_x0, m_y0, width(), height());
}

cv::Rect Rect::toPixels(const cv::Size &imageSize) const {
  int left = static_cast<int>(std::floor(m_x0));
  int top = static_cast<int>(std::floor(m_y0));
  int right = static_cast<int>(std::ceil(m_x1));
  int bottom = static_cast<int>(std::ceil(m_y1));

  cv::Rect pixels(left, top, right - left, bottom - top);
  return pixels & cv::Rect(0, 0, imageSize.width, imageSize.height);
}

bool Rect::operator==(const Rect &other) const {
  return m_x0 == other.m_x0 && m_y0 == other.m_y0 && m_x1 == other.m_x1 &&
         m_y1 == other.m_y1;
}

double distance(const Rect &a, const Rect &b) { return a.distanceTo(b); }

Rect unite(const Rect &a, const Rect &b) { return a.united(b); }

std::ostream &operator<<(std::ostream &os, const Rect &rect) {
  os << "(" << rect.x0() << ", " << rect.y0() << ", " << rect.x1() << ", "
     << rect.y1() << ")";
  return os;
}

} // namespace regions
