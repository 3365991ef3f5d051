#ifndef REGIONS_LABEL_ASSOCIATOR_HPP
#define REGIONS_LABEL_ASSOCIATOR_HPP

#include "PageModel.hpp"
#include "RegionConfig.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief Attaches short callout texts to a region
 *
 * A span is a label of a region when its text, trimmed, has between
 * minLabelLength and maxLabelLength characters, contains none of the denylist
 * tokens (case-insensitive), and either its center lies inside the region or
 * its box is closer than labelDistance to the region.
 */
class LabelAssociator {
public:
  LabelAssociator();
  explicit LabelAssociator(const RegionConfig &config);

  /**
   * @brief Collect the labels of one region
   * @param region Final region rectangle
   * @param spans Text spans of the page, in scan order
   * @return Accepted labels, in the order of spans
   */
  std::vector<Label> associate(const Rect &region,
                               const std::vector<TextSpan> &spans) const;

  /**
   * @brief Label a sequence of regions
   *
   * With exclusiveLabels set a span binds to the first region in the sequence
   * that accepts it and is not offered to later ones; otherwise every region
   * is labelled independently and a span may label several regions.
   */
  std::vector<ExtractedRegion>
  associateAll(const std::vector<Rect> &regions,
               const std::vector<TextSpan> &spans) const;

  /**
   * @brief Whether a text passes the length and denylist filters
   */
  bool isLabelText(const std::string &text) const;

  /**
   * @brief Whether a span lies inside or near the region
   */
  bool isNear(const Rect &region, const Rect &span) const;

private:
  std::optional<Label> toLabel(const Rect &region, const TextSpan &span) const;

  double m_labelDistance;
  std::size_t m_minLength;
  std::size_t m_maxLength;
  std::vector<std::string> m_denylist; ///< Upper-cased tokens
  bool m_exclusive;
};

/**
 * @brief Strip leading and trailing whitespace
 */
std::string trimText(const std::string &text);

/**
 * @brief Number of characters (UTF-8 code points) in a string
 */
std::size_t utf8Length(const std::string &text);

} // namespace regions

#endif // REGIONS_LABEL_ASSOCIATOR_HPP
