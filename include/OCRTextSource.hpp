#ifndef REGIONS_OCR_TEXT_SOURCE_HPP
#define REGIONS_OCR_TEXT_SOURCE_HPP

#include "PageModel.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief Configuration options for OCR processing
 */
struct OCRConfig {
  std::string language = "eng"; ///< Language code (e.g., "eng", "deu+eng")
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_SPARSE_TEXT; ///< Callouts are scattered, not paragraphs
  bool preprocessImage = true;    ///< Grayscale + adaptive threshold first
  int minConfidence = 30;         ///< Words below this (0-100) are dropped
  std::string tessDataPath = "";  ///< Path to tessdata (empty = environment)
};

/**
 * @brief Result of recognizing the words of a page image
 */
struct TextSpansResult {
  bool success = false;          ///< Whether recognition ran
  std::string errorMessage;      ///< Error message if failed
  std::vector<TextSpan> spans;   ///< Words in Tesseract reading order
  double processingTimeMs = 0;   ///< Processing time in milliseconds
};

/**
 * @brief Word-level text spans of scanned pages using Tesseract
 *
 * Example usage:
 * @code
 * regions::OCRTextSource ocr;
 * if (ocr.initialize()) {
 *     auto result = ocr.recognizeWords(image, 72.0 / 300.0);
 * }
 * @endcode
 */
class OCRTextSource {
public:
  OCRTextSource() = default;
  explicit OCRTextSource(const OCRConfig &config);

  // Tesseract API is not copyable
  OCRTextSource(const OCRTextSource &) = delete;
  OCRTextSource &operator=(const OCRTextSource &) = delete;

  OCRTextSource(OCRTextSource &&) noexcept = default;
  OCRTextSource &operator=(OCRTextSource &&) noexcept = default;

  /**
   * @brief Initialize the OCR engine
   *
   * tessdata is taken from the configuration, then TESSDATA_PREFIX, then the
   * Tesseract default.
   *
   * @return true if initialization was successful
   */
  bool initialize();

  bool isInitialized() const;

  /**
   * @brief Recognize the words of a page image
   * @param image Page image (BGR, BGRA or grayscale)
   * @param scale Factor from pixels to page units (72 / dpi for points)
   * @return Spans with boxes scaled to page units
   */
  TextSpansResult recognizeWords(const cv::Mat &image, double scale = 1.0);

  const OCRConfig &getConfig() const;

  static std::string getTesseractVersion();

private:
  cv::Mat preprocessImage(const cv::Mat &image) const;

  void setImage(const cv::Mat &image);

  std::unique_ptr<tesseract::TessBaseAPI> m_tesseract; ///< Set by initialize()
  OCRConfig m_config;
};

} // namespace regions

#endif // REGIONS_OCR_TEXT_SOURCE_HPP
