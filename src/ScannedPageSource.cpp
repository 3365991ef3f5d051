#include "ScannedPageSource.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <chrono>
#include <iostream>

namespace regions {

ScannedPageSource::ScannedPageSource(const ScannedPageConfig &config,
                                     OCRTextSource *ocr)
    : m_config(config), m_ocr(ocr) {}

double ScannedPageSource::pixelScale() const {
  return m_config.dpi > 0.0 ? 72.0 / m_config.dpi : 1.0;
}

PageLoadResult ScannedPageSource::loadImage(const std::string &imagePath,
                                            int pageNumber) {
  PageLoadResult result;

  cv::Mat image;
  try {
    image = cv::imread(imagePath, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    result.errorMessage = "Failed to read image " + imagePath + ": " + e.what();
    return result;
  }

  if (image.empty()) {
    result.errorMessage = "Failed to load image: " + imagePath;
    return result;
  }

  return analyzePage(image, pageNumber);
}

PageLoadResult ScannedPageSource::analyzePage(const cv::Mat &image,
                                              int pageNumber) {
  PageLoadResult result;

  if (image.empty()) {
    result.errorMessage = "Input image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    double scale = pixelScale();

    PageContent &page = result.page;
    page.pageNumber = pageNumber;
    page.width = image.cols * scale;
    page.height = image.rows * scale;

    // Words are recognized in pixels first so they can be blanked out of the
    // graphic search, then converted
    std::vector<cv::Rect> textBoxes;
    if (m_ocr && m_ocr->isInitialized()) {
      TextSpansResult words = m_ocr->recognizeWords(image, 1.0);
      if (words.success) {
        for (auto &span : words.spans) {
          textBoxes.push_back(span.boundingBox.toPixels(image.size()));
          span.boundingBox = span.boundingBox.scaled(scale);
          page.textSpans.push_back(span);
        }
      } else {
        std::cerr << "Page " << pageNumber
                  << ": text recognition failed: " << words.errorMessage
                  << std::endl;
      }
    }

    for (const auto &block : findGraphicBlocks(image, textBoxes)) {
      ImageBlock imageBlock;
      imageBlock.boundingBox = Rect::fromCv(cv::Rect2d(block)).scaled(scale);
      page.images.push_back(imageBlock);
    }

    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("Scanned page analysis failed: ") +
                          e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

std::vector<cv::Rect> ScannedPageSource::findGraphicBlocks(
    const cv::Mat &image, const std::vector<cv::Rect> &textBoxes) const {
  std::vector<cv::Rect> blocks;
  if (image.empty()) {
    return blocks;
  }

  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.clone();
  }

  cv::Rect imageRect(0, 0, gray.cols, gray.rows);
  for (const auto &box : textBoxes) {
    cv::Rect valid = box & imageRect;
    if (!valid.empty()) {
      gray(valid).setTo(cv::Scalar(255));
    }
  }

  // Edge map, dilated so strokes of one drawing connect
  cv::Mat edges;
  cv::Canny(gray, edges, 50, 150);
  cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5));
  cv::dilate(edges, edges, kernel, cv::Point(-1, -1), 2);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  for (const auto &contour : contours) {
    cv::Rect boundingRect = cv::boundingRect(contour);

    if (boundingRect.width < m_config.minBlockWidth ||
        boundingRect.height < m_config.minBlockHeight) {
      continue;
    }

    if (boundingRect.width > m_config.maxBlockCoverage * image.cols &&
        boundingRect.height > m_config.maxBlockCoverage * image.rows) {
      continue;
    }

    if (!isLikelyGraphic(image, contour, boundingRect)) {
      continue;
    }

    int padding = m_config.blockPadding;
    cv::Rect padded(boundingRect.x - padding, boundingRect.y - padding,
                    boundingRect.width + 2 * padding,
                    boundingRect.height + 2 * padding);
    blocks.push_back(padded & imageRect);
  }

  return blocks;
}

bool ScannedPageSource::isLikelyGraphic(const cv::Mat &image,
                                        const std::vector<cv::Point> &contour,
                                        const cv::Rect &boundingRect) const {
  cv::Rect validRect = boundingRect & cv::Rect(0, 0, image.cols, image.rows);
  if (validRect.empty() || validRect.width < 10 || validRect.height < 10) {
    return false;
  }

  cv::Mat roi = image(validRect);

  // Drawings are compact; text lines that slipped through OCR are very wide
  double aspectRatio =
      static_cast<double>(boundingRect.width) / boundingRect.height;
  bool isSquarish = (aspectRatio >= 0.5 && aspectRatio <= 2.0);

  // Line art has low solidity relative to its convex hull
  double contourArea = cv::contourArea(contour);
  std::vector<cv::Point> hull;
  cv::convexHull(contour, hull);
  double hullArea = cv::contourArea(hull);
  double solidity = (hullArea > 0) ? (contourArea / hullArea) : 0;
  bool hasComplexShape = (solidity < 0.7);

  cv::Mat grayRoi;
  if (roi.channels() == 3) {
    cv::cvtColor(roi, grayRoi, cv::COLOR_BGR2GRAY);
  } else if (roi.channels() == 4) {
    cv::cvtColor(roi, grayRoi, cv::COLOR_BGRA2GRAY);
  } else {
    grayRoi = roi;
  }

  cv::Mat edges;
  cv::Canny(grayRoi, edges, 50, 150);
  double edgeDensity = static_cast<double>(cv::countNonZero(edges)) /
                       (validRect.width * validRect.height);
  bool hasEdges = (edgeDensity > 0.02);

  // Ink coverage: drawings are neither blank nor solid
  cv::Mat binaryRoi;
  cv::threshold(grayRoi, binaryRoi, 0, 255,
                cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
  double fillRatio = static_cast<double>(cv::countNonZero(binaryRoi)) /
                     (validRect.width * validRect.height);
  bool hasLineArtFill = (fillRatio > 0.01 && fillRatio < 0.6);

  int graphicScore = 0;
  if (isSquarish)
    graphicScore += 2;
  if (hasComplexShape)
    graphicScore += 2;
  if (hasEdges)
    graphicScore += 1;
  if (hasLineArtFill)
    graphicScore += 2;

  return graphicScore >= 4;
}

} // namespace regions
