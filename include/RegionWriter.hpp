#ifndef REGIONS_REGION_WRITER_HPP
#define REGIONS_REGION_WRITER_HPP

#include "PageModel.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief Output options of the region writer
 */
struct RegionWriterConfig {
  std::string outputDir = "regions"; ///< Root output directory
  std::string filePrefix;            ///< Prepended to table file names
  double dpi = 300.0;  ///< Resolution of the page images handed to the writer
  int cropPadding = 10; ///< Pixels added around table crops
  bool writeSidecars = true; ///< JSON metadata next to each crop
};

/**
 * @brief Result of writing the regions of one page
 */
struct WriteResult {
  bool success = false;                  ///< False if any file failed
  std::string errorMessage;              ///< Last error if failed
  std::vector<std::string> writtenFiles; ///< Paths of written files
  double processingTimeMs = 0;           ///< Processing time in milliseconds
};

/**
 * @brief Saves region crops of a rendered page as PNG files
 *
 * Diagram regions are in page units (points) and are scaled by dpi / 72 onto
 * the page image; their labels are drawn in red at their page positions.
 * Table regions are in pixels of the page image (detector space) and are
 * padded by cropPadding. Every crop may get a JSON sidecar:
 *
 * @code{.json}
 * { "file": "page3_diagram1.png", "labels": ["A1", "B2"], "page": 3,
 *   "bbox": [x0, y0, x1, y1], "type": "merged" }
 * @endcode
 *
 * Layout: diagrams go to outputDir, table crops to outputDir/crops and table
 * debug overlays to outputDir/debug.
 */
class RegionWriter {
public:
  explicit RegionWriter(const RegionWriterConfig &config);

  /**
   * @brief Create the output directories
   */
  bool prepare(std::string &errorMessage) const;

  /**
   * @brief Save diagram crops of one page
   * @param pageImage Page rendered at the configured dpi
   * @param pageNumber 1-indexed page number
   * @param regions Regions in page units, numbered in the given order
   */
  WriteResult writeDiagrams(const cv::Mat &pageImage, int pageNumber,
                            const std::vector<ExtractedRegion> &regions) const;

  /**
   * @brief Save table crops of one page
   * @param tables Inner tables in pixel coordinates of pageImage
   */
  WriteResult writeTables(const cv::Mat &pageImage, int pageNumber,
                          const std::vector<CandidateRegion> &tables) const;

  /**
   * @brief Save the page with the kept tables outlined and scored
   */
  WriteResult writeTableOverlay(const cv::Mat &pageImage, int pageNumber,
                                const std::vector<CandidateRegion> &tables) const;

  /**
   * @brief Pixel rectangle of a page-unit region on an image at the
   * configured dpi, clipped to the image
   */
  cv::Rect toPixelRect(const Rect &region, const cv::Size &imageSize) const;

  static std::string diagramFileName(int pageNumber, int index);
  static std::string tableFileName(int pageNumber, int index);
  static std::string overlayFileName(int pageNumber);

  const RegionWriterConfig &getConfig() const { return m_config; }

private:
  bool writeSidecar(const std::string &pngPath, const std::string &fileName,
                    const std::vector<std::string> &labels, int pageNumber,
                    const Rect &bbox, const std::string &type,
                    const std::optional<double> &score,
                    std::string &errorMessage) const;

  void drawLabels(cv::Mat &crop, const cv::Rect &cropRect,
                  const std::vector<Label> &labels) const;

  RegionWriterConfig m_config;
};

} // namespace regions

#endif // REGIONS_REGION_WRITER_HPP
