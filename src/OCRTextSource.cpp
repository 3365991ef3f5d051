#include "OCRTextSource.hpp"

#include <opencv2/imgproc.hpp>
#include <tesseract/resultiterator.h>

#include <chrono>
#include <cstdlib>
#include <iostream>

namespace regions {

OCRTextSource::OCRTextSource(const OCRConfig &config) : m_config(config) {}

bool OCRTextSource::initialize() {
  if (m_tesseract) {
    return true;
  }

  // nullptr lets Tesseract fall back to its compiled-in default
  const char *tessDataPath = nullptr;
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  } else {
    tessDataPath = std::getenv("TESSDATA_PREFIX");
  }

  // The engine is kept only once Init succeeded
  auto api = std::make_unique<tesseract::TessBaseAPI>();
  if (api->Init(tessDataPath, m_config.language.c_str()) != 0) {
    std::cerr << "Failed to initialize Tesseract with language: "
              << m_config.language << std::endl;
    return false;
  }

  api->SetPageSegMode(m_config.pageSegMode);
  m_tesseract = std::move(api);
  return true;
}

bool OCRTextSource::isInitialized() const { return m_tesseract != nullptr; }

TextSpansResult OCRTextSource::recognizeWords(const cv::Mat &image,
                                              double scale) {
  TextSpansResult result;

  if (!m_tesseract) {
    result.errorMessage =
        "OCR engine not initialized. Call initialize() first.";
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    setImage(m_config.preprocessImage ? preprocessImage(image) : image);

    // Must call Recognize before GetIterator
    if (m_tesseract->Recognize(nullptr) != 0) {
      result.errorMessage = "Tesseract recognition failed";
      return result;
    }

    std::unique_ptr<tesseract::ResultIterator> ri(m_tesseract->GetIterator());
    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;

    if (ri) {
      do {
        std::unique_ptr<char[]> word(ri->GetUTF8Text(level));
        if (!word || *word.get() == '\0') {
          continue;
        }
        if (ri->Confidence(level) < m_config.minConfidence) {
          continue;
        }

        int x1, y1, x2, y2;
        if (!ri->BoundingBox(level, &x1, &y1, &x2, &y2) ||
            !Rect::isWellFormed(x1, y1, x2, y2)) {
          continue;
        }

        TextSpan span;
        span.text = word.get();
        span.boundingBox = Rect(x1, y1, x2, y2).scaled(scale);
        result.spans.push_back(span);
      } while (ri->Next(level));
    }

    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("OCR word recognition failed: ") +
                          e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

const OCRConfig &OCRTextSource::getConfig() const { return m_config; }

std::string OCRTextSource::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

cv::Mat OCRTextSource::preprocessImage(const cv::Mat &image) const {
  cv::Mat processed;

  if (image.channels() == 3) {
    cv::cvtColor(image, processed, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, processed, cv::COLOR_BGRA2GRAY);
  } else {
    processed = image.clone();
  }

  cv::GaussianBlur(processed, processed, cv::Size(3, 3), 0);
  cv::adaptiveThreshold(processed, processed, 255,
                        cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11,
                        2);
  return processed;
}

void OCRTextSource::setImage(const cv::Mat &image) {
  cv::Mat rgbImage;

  // Tesseract expects RGB
  if (image.channels() == 1) {
    cv::cvtColor(image, rgbImage, cv::COLOR_GRAY2RGB);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGRA2RGB);
  } else {
    cv::cvtColor(image, rgbImage, cv::COLOR_BGR2RGB);
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace regions
