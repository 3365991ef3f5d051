#ifndef REGIONS_SCANNED_PAGE_SOURCE_HPP
#define REGIONS_SCANNED_PAGE_SOURCE_HPP

#include "OCRTextSource.hpp"
#include "PageModel.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace regions {

/**
 * @brief Options for turning a page image into page content
 */
struct ScannedPageConfig {
  double dpi = 300.0;           ///< Scan resolution, pixels per inch
  int minBlockWidth = 50;       ///< Smallest graphic block, pixels
  int minBlockHeight = 50;      ///< Smallest graphic block, pixels
  double maxBlockCoverage = 0.9; ///< Blocks spanning more of both page
                                 ///< dimensions are frames, not graphics
  int blockPadding = 5;         ///< Pixels added around each block
};

/**
 * @brief Page source for scanned pages (raster images)
 *
 * A scanned page has no vector drawings. Its graphics are reported as image
 * blocks found by contour analysis, and its text, when an OCR source is
 * attached, as Tesseract words. Coordinates are converted from pixels to
 * points (72 per inch) so the engine's thresholds apply unchanged.
 */
class ScannedPageSource {
public:
  /**
   * @param config Scan options
   * @param ocr Initialized OCR source, or nullptr to skip text recognition.
   * Not owned; must outlive this object.
   */
  explicit ScannedPageSource(const ScannedPageConfig &config,
                             OCRTextSource *ocr = nullptr);

  /**
   * @brief Load an image file as one page
   */
  PageLoadResult loadImage(const std::string &imagePath, int pageNumber = 1);

  /**
   * @brief Build page content from an image already in memory
   */
  PageLoadResult analyzePage(const cv::Mat &image, int pageNumber = 1);

  /**
   * @brief Bounding boxes of graphic blocks in pixel coordinates
   * @param image Page image
   * @param textBoxes Recognized words (pixels), blanked before the search
   */
  std::vector<cv::Rect> findGraphicBlocks(
      const cv::Mat &image, const std::vector<cv::Rect> &textBoxes) const;

  /// Factor from pixels to points
  double pixelScale() const;

private:
  bool isLikelyGraphic(const cv::Mat &image,
                       const std::vector<cv::Point> &contour,
                       const cv::Rect &boundingRect) const;

  ScannedPageConfig m_config;
  OCRTextSource *m_ocr;
};

} // namespace regions

#endif // REGIONS_SCANNED_PAGE_SOURCE_HPP
