#ifndef REGIONS_SHAPE_CLASSIFIER_HPP
#define REGIONS_SHAPE_CLASSIFIER_HPP

#include "PageModel.hpp"
#include "RegionConfig.hpp"

#include <optional>
#include <vector>

namespace regions {

/**
 * @brief Primitive counts of one vector drawing
 */
struct ShapeCounts {
  int lines = 0;
  int rects = 0;
  int curves = 0;

  int total() const { return lines + rects + curves; }
};

/**
 * @brief Decides whether a vector drawing looks like a technical diagram
 *
 * The decision, in order:
 * 1. Reject ruled grids: many lines and many rectangles with almost no curves
 *    (table rulings rather than a diagram).
 * 2. Reject wide and short drawings (horizontal rules and banners).
 * 3. Accept when the drawing has enough curves.
 * 4. Otherwise accept when the drawing has more primitives than the minimum.
 *
 * Approximate by nature; the result only depends on the shapes and thresholds.
 */
class ShapeClassifier {
public:
  ShapeClassifier() = default;
  explicit ShapeClassifier(const ClassifierThresholds &thresholds);

  bool isPotentialDiagram(const std::vector<PrimitiveShape> &shapes) const;

  static ShapeCounts countShapes(const std::vector<PrimitiveShape> &shapes);

  /**
   * @brief Bounding box of all primitives, empty optional for no shapes
   */
  static std::optional<Rect>
  aggregateBounds(const std::vector<PrimitiveShape> &shapes);

  const ClassifierThresholds &getThresholds() const { return m_thresholds; }

private:
  ClassifierThresholds m_thresholds;
};

} // namespace regions

#endif // REGIONS_SHAPE_CLASSIFIER_HPP
