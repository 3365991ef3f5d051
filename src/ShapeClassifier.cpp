#include "ShapeClassifier.hpp"

namespace regions {

namespace {

struct ShapeCounter {
  ShapeCounts &counts;

  void operator()(const LineShape &) const { counts.lines++; }
  void operator()(const RectShape &) const { counts.rects++; }
  void operator()(const CurveShape &) const { counts.curves++; }
};

} // anonymous namespace

ShapeClassifier::ShapeClassifier(const ClassifierThresholds &thresholds)
    : m_thresholds(thresholds) {}

bool ShapeClassifier::isPotentialDiagram(
    const std::vector<PrimitiveShape> &shapes) const {
  std::optional<Rect> bounds = aggregateBounds(shapes);
  if (!bounds) {
    return false;
  }

  ShapeCounts counts = countShapes(shapes);

  // Ruled grid: a table, not a diagram
  if (counts.lines > m_thresholds.bannerMinLines &&
      counts.rects > m_thresholds.bannerMinRects &&
      counts.curves < m_thresholds.bannerMaxCurves) {
    return false;
  }

  // Horizontal rule or banner
  if (bounds->width() > m_thresholds.bannerMinWidth &&
      bounds->height() < m_thresholds.bannerMaxHeight) {
    return false;
  }

  if (counts.curves >= m_thresholds.minCurves) {
    return true;
  }

  return counts.total() > m_thresholds.minPrimitives;
}

ShapeCounts
ShapeClassifier::countShapes(const std::vector<PrimitiveShape> &shapes) {
  ShapeCounts counts;
  ShapeCounter counter{counts};
  for (const auto &shape : shapes) {
    std::visit(counter, shape);
  }
  return counts;
}

std::optional<Rect>
ShapeClassifier::aggregateBounds(const std::vector<PrimitiveShape> &shapes) {
  if (shapes.empty()) {
    return std::nullopt;
  }

  Rect bounds = boundingBoxOf(shapes.front());
  for (size_t i = 1; i < shapes.size(); i++) {
    bounds = bounds.united(boundingBoxOf(shapes[i]));
  }
  return bounds;
}

} // namespace regions
