#include "TableDetector.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace regions {

RulingTableDetector::RulingTableDetector(const RulingTableConfig &config)
    : m_config(config) {}

void RulingTableDetector::extractRulings(const cv::Mat &pageImage,
                                         cv::Mat &horizontal,
                                         cv::Mat &vertical) const {
  cv::Mat gray;
  if (pageImage.channels() == 3) {
    cv::cvtColor(pageImage, gray, cv::COLOR_BGR2GRAY);
  } else if (pageImage.channels() == 4) {
    cv::cvtColor(pageImage, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = pageImage.clone();
  }

  // Dark strokes on a light page become foreground
  cv::Mat binary;
  cv::adaptiveThreshold(~gray, binary, 255, cv::ADAPTIVE_THRESH_MEAN_C,
                        cv::THRESH_BINARY, 15, -2);

  int scale = std::max(1, m_config.rulingScale);
  int horizontalLength = std::max(1, binary.cols / scale);
  int verticalLength = std::max(1, binary.rows / scale);

  cv::Mat horizontalKernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(horizontalLength, 1));
  cv::morphologyEx(binary, horizontal, cv::MORPH_OPEN, horizontalKernel);

  cv::Mat verticalKernel =
      cv::getStructuringElement(cv::MORPH_RECT, cv::Size(1, verticalLength));
  cv::morphologyEx(binary, vertical, cv::MORPH_OPEN, verticalKernel);
}

cv::Mat RulingTableDetector::rulingMask(const cv::Mat &pageImage) const {
  if (pageImage.empty()) {
    return cv::Mat();
  }

  cv::Mat horizontal, vertical, mask;
  extractRulings(pageImage, horizontal, vertical);
  cv::bitwise_or(horizontal, vertical, mask);
  return mask;
}

std::vector<Detection> RulingTableDetector::detect(const cv::Mat &pageImage) {
  std::vector<Detection> detections;
  if (pageImage.empty()) {
    return detections;
  }

  cv::Mat horizontal, vertical;
  extractRulings(pageImage, horizontal, vertical);

  cv::Mat mask, junctions;
  cv::bitwise_or(horizontal, vertical, mask);
  cv::bitwise_and(horizontal, vertical, junctions);

  // Close small gaps so one crossing of thick rulings counts once
  cv::dilate(junctions, junctions,
             cv::getStructuringElement(cv::MORPH_RECT, cv::Size(3, 3)));

  std::vector<std::vector<cv::Point>> contours;
  std::vector<cv::Vec4i> hierarchy;
  cv::findContours(mask.clone(), contours, hierarchy, cv::RETR_TREE,
                   cv::CHAIN_APPROX_SIMPLE);

  for (size_t i = 0; i < contours.size(); i++) {
    // Outer boundaries sit at even depth, holes (cells) at odd depth
    int depth = 0;
    for (int parent = hierarchy[i][3]; parent >= 0;
         parent = hierarchy[parent][3]) {
      depth++;
    }
    if (depth % 2 != 0) {
      continue;
    }

    cv::Rect box = cv::boundingRect(contours[i]);
    if (box.width < m_config.minTableWidth ||
        box.height < m_config.minTableHeight) {
      continue;
    }

    cv::Mat labels;
    int junctionCount = cv::connectedComponents(junctions(box), labels) - 1;
    if (junctionCount < m_config.minJunctions) {
      continue;
    }

    Detection detection;
    detection.boundingBox = Rect(box.x, box.y, box.x + box.width,
                                 box.y + box.height);
    detection.score =
        std::min(1.0, static_cast<double>(junctionCount) /
                          std::max(1, m_config.fullScoreJunctions));
    detection.label = "table";
    detections.push_back(detection);
  }

  return detections;
}

std::vector<CandidateRegion> detectInnerTables(TableDetector &detector,
                                               const RegionExtractor &extractor,
                                               const cv::Mat &pageImage) {
  if (pageImage.empty()) {
    return {};
  }
  return extractor.selectTables(detector.detect(pageImage));
}

} // namespace regions
