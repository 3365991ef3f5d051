#ifndef REGIONS_REGION_EXTRACTOR_HPP
#define REGIONS_REGION_EXTRACTOR_HPP

#include "LabelAssociator.hpp"
#include "PageModel.hpp"
#include "RegionConfig.hpp"
#include "ShapeClassifier.hpp"

#include <vector>

namespace regions {

/**
 * @brief Per-page diagram and table region pipeline
 *
 * Stateless between calls: every method only reads its arguments and the
 * configuration given at construction, so one extractor can serve pages
 * processed on different threads.
 *
 * Diagram pipeline for one page:
 * 1. Vector drawings accepted by the ShapeClassifier become candidates, unless
 *    they overlap the header or footer band.
 * 2. Raster image blocks at least minImageWidth x minImageHeight become
 *    candidates, with the same header/footer exclusion.
 * 3. All candidates are merged (mergeDistance, mergeMode).
 * 4. Regions with no width or height, or outside the page, are dropped.
 * 5. Outer regions are removed and the size-ratio filter applied. After
 *    outer removal no region contains another, so the size filter only drops
 *    regions when removeOuterRegions is off.
 * 6. Each remaining region gets its labels.
 *
 * Example usage:
 * @code
 * regions::RegionExtractor extractor;
 * for (const auto &region : extractor.extractDiagrams(page)) {
 *     std::cout << region.boundingBox << " " << region.labels.size() << "\n";
 * }
 * @endcode
 */
class RegionExtractor {
public:
  RegionExtractor();
  explicit RegionExtractor(const RegionConfig &config);

  /**
   * @brief Run the diagram pipeline on one page
   * @return Regions with their labels, in page scan order; empty when the
   * page has no diagram
   */
  std::vector<ExtractedRegion> extractDiagrams(const PageContent &page) const;

  /**
   * @brief Vector drawings accepted as diagram candidates
   */
  std::vector<CandidateRegion>
  collectVectorCandidates(const PageContent &page) const;

  /**
   * @brief Raster image blocks large enough to be diagram candidates
   */
  std::vector<CandidateRegion>
  collectImageCandidates(const PageContent &page) const;

  /**
   * @brief Merge and filter candidates into final region rectangles
   *
   * Steps 3 to 5 of the pipeline, without labels.
   */
  std::vector<Rect> resolveRegions(const std::vector<CandidateRegion> &candidates,
                                   const Rect &pageRect) const;

  /**
   * @brief Keep only inner tables among detector boxes
   *
   * Detections whose label does not contain tableLabelToken
   * (case-insensitive), whose score is below minTableScore, or whose box is
   * empty are ignored. Of the rest, a box covering another one (see
   * containmentThreshold) is the parent table and is dropped.
   *
   * @param detections Detector output in detector order
   * @return Inner tables with their scores, in detector order
   */
  std::vector<CandidateRegion>
  selectTables(const std::vector<Detection> &detections) const;

  /**
   * @brief Whether a rectangle reaches into the header or footer band
   */
  bool isInHeaderOrFooter(const Rect &rect, double pageHeight) const;

  const RegionConfig &getConfig() const { return m_config; }

private:
  RegionConfig m_config;
  ShapeClassifier m_classifier;
  LabelAssociator m_labels;
};

} // namespace regions

#endif // REGIONS_REGION_EXTRACTOR_HPP
