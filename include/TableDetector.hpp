#ifndef REGIONS_TABLE_DETECTOR_HPP
#define REGIONS_TABLE_DETECTOR_HPP

#include "PageModel.hpp"
#include "RegionExtractor.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace regions {

/**
 * @brief Detector capability producing labelled boxes for a page image
 *
 * Constructed once by the caller and passed to whatever processes pages. The
 * region engine never calls a detector itself; it only consumes Detection
 * boxes (see RegionExtractor::selectTables).
 */
class TableDetector {
public:
  virtual ~TableDetector() = default;

  /**
   * @brief Detect table candidates
   * @param pageImage Rendered or scanned page (BGR, BGRA or grayscale)
   * @return Boxes in pixel coordinates of pageImage
   */
  virtual std::vector<Detection> detect(const cv::Mat &pageImage) = 0;
};

/**
 * @brief Tuning of the ruling-based detector
 */
struct RulingTableConfig {
  int rulingScale = 30;       ///< Min ruling length = image dimension / scale
  int minTableWidth = 60;     ///< Pixels
  int minTableHeight = 40;    ///< Pixels
  int minJunctions = 9;       ///< Ruling crossings needed to call it a table
  int fullScoreJunctions = 16; ///< Crossings giving a score of 1.0
};

/**
 * @brief Finds ruled tables from their horizontal and vertical rulings
 *
 * Rulings are isolated with morphological opening along each axis; each
 * connected ruling structure whose bounding box holds enough crossings of
 * horizontal and vertical rulings is reported as a "table". Nested tables
 * drawn inside a cell of a larger table are reported separately, together
 * with the enclosing table.
 */
class RulingTableDetector : public TableDetector {
public:
  RulingTableDetector() = default;
  explicit RulingTableDetector(const RulingTableConfig &config);

  std::vector<Detection> detect(const cv::Mat &pageImage) override;

  /**
   * @brief Binary mask of the horizontal and vertical rulings
   */
  cv::Mat rulingMask(const cv::Mat &pageImage) const;

private:
  void extractRulings(const cv::Mat &pageImage, cv::Mat &horizontal,
                      cv::Mat &vertical) const;

  RulingTableConfig m_config;
};

/**
 * @brief Inner tables on a page image
 *
 * Runs the detector and keeps the boxes RegionExtractor::selectTables
 * accepts. Diagram mode uses it to skip pages that hold tables.
 */
std::vector<CandidateRegion> detectInnerTables(TableDetector &detector,
                                               const RegionExtractor &extractor,
                                               const cv::Mat &pageImage);

} // namespace regions

#endif // REGIONS_TABLE_DETECTOR_HPP
