#ifndef REGIONS_PDF_PAGE_SOURCE_HPP
#define REGIONS_PDF_PAGE_SOURCE_HPP

#include "PageModel.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>

namespace regions {

/**
 * @brief Result of rendering a PDF page
 */
struct PageRenderResult {
  bool success = false;        ///< Whether rendering succeeded
  std::string errorMessage;    ///< Error message if failed
  cv::Mat image;               ///< Rendered page (BGR)
  double dpi = 0;              ///< Resolution used for rendering
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Page source for PDF documents using Poppler
 *
 * Supplies, per page, the vector drawings (one ShapeCluster per painted path,
 * decomposed into line, rectangle and curve primitives), the placed raster
 * images and the text boxes, all in points with the origin at the top-left of
 * the page.
 *
 * Example usage:
 * @code
 * regions::PDFPageSource source;
 * if (source.open("drawing.pdf")) {
 *     for (int n = 1; n <= source.pageCount(); n++) {
 *         auto loaded = source.loadPage(n);
 *     }
 * }
 * @endcode
 */
class PDFPageSource {
public:
  PDFPageSource();
  ~PDFPageSource();

  PDFPageSource(const PDFPageSource &) = delete;
  PDFPageSource &operator=(const PDFPageSource &) = delete;

  PDFPageSource(PDFPageSource &&other) noexcept;
  PDFPageSource &operator=(PDFPageSource &&other) noexcept;

  /**
   * @brief Open a PDF file
   * @return false if the file cannot be loaded or is password protected;
   * getErrorMessage() tells why
   */
  bool open(const std::string &pdfPath);

  bool isOpen() const;

  const std::string &getErrorMessage() const;

  /**
   * @brief Number of pages, 0 when no document is open
   */
  int pageCount() const;

  /**
   * @brief Extract drawings, images and text of a page
   * @param pageNumber 1-indexed page number
   */
  PageLoadResult loadPage(int pageNumber);

  /**
   * @brief Render a page
   * @param pageNumber 1-indexed page number
   * @param dpi Resolution; one point maps to dpi / 72 pixels
   */
  PageRenderResult renderPage(int pageNumber, double dpi);

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace regions

#endif // REGIONS_PDF_PAGE_SOURCE_HPP
