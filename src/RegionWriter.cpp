#include "RegionWriter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace regions {

namespace {

std::string replaceExtension(const std::string &path, const std::string &ext) {
  std::filesystem::path p(path);
  p.replace_extension(ext);
  return p.string();
}

} // anonymous namespace

RegionWriter::RegionWriter(const RegionWriterConfig &config)
    : m_config(config) {}

bool RegionWriter::prepare(std::string &errorMessage) const {
  try {
    std::filesystem::path root(m_config.outputDir);
    std::filesystem::create_directories(root);
    std::filesystem::create_directories(root / "crops");
    std::filesystem::create_directories(root / "debug");
  } catch (const std::filesystem::filesystem_error &e) {
    errorMessage = std::string("Failed to create output directory: ") +
                   e.what();
    return false;
  }
  return true;
}

std::string RegionWriter::diagramFileName(int pageNumber, int index) {
  return "page" + std::to_string(pageNumber) + "_diagram" +
         std::to_string(index) + ".png";
}

std::string RegionWriter::tableFileName(int pageNumber, int index) {
  std::ostringstream name;
  name << "page" << std::setw(4) << std::setfill('0') << pageNumber
       << "_table" << std::setw(2) << std::setfill('0') << index << ".png";
  return name.str();
}

std::string RegionWriter::overlayFileName(int pageNumber) {
  std::ostringstream name;
  name << "page" << std::setw(4) << std::setfill('0') << pageNumber
       << "_debug.png";
  return name.str();
}

cv::Rect RegionWriter::toPixelRect(const Rect &region,
                                   const cv::Size &imageSize) const {
  double zoom = m_config.dpi / 72.0;
  return region.scaled(zoom).toPixels(imageSize);
}

WriteResult
RegionWriter::writeDiagrams(const cv::Mat &pageImage, int pageNumber,
                            const std::vector<ExtractedRegion> &regions) const {
  WriteResult result;
  result.success = true;

  if (pageImage.empty()) {
    result.success = false;
    result.errorMessage = "Page image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  for (size_t i = 0; i < regions.size(); i++) {
    const ExtractedRegion &region = regions[i];
    cv::Rect cropRect = toPixelRect(region.boundingBox, pageImage.size());
    if (cropRect.empty()) {
      std::cerr << "Page " << pageNumber << ": region " << (i + 1)
                << " maps to an empty crop, skipped" << std::endl;
      continue;
    }

    cv::Mat crop = pageImage(cropRect).clone();
    drawLabels(crop, cropRect, region.labels);

    std::string fileName = diagramFileName(pageNumber, static_cast<int>(i) + 1);
    std::string outPath =
        (std::filesystem::path(m_config.outputDir) / fileName).string();

    try {
      if (!cv::imwrite(outPath, crop)) {
        result.success = false;
        result.errorMessage = "Failed to write " + outPath;
        continue;
      }
    } catch (const cv::Exception &e) {
      result.success = false;
      result.errorMessage = "Failed to write " + outPath + ": " + e.what();
      continue;
    }
    result.writtenFiles.push_back(outPath);

    if (m_config.writeSidecars) {
      std::vector<std::string> labelTexts;
      for (const auto &label : region.labels) {
        labelTexts.push_back(label.text);
      }

      std::string error;
      if (writeSidecar(outPath, fileName, labelTexts, pageNumber,
                       region.boundingBox, "merged", std::nullopt, error)) {
        result.writtenFiles.push_back(replaceExtension(outPath, ".json"));
      } else {
        result.success = false;
        result.errorMessage = error;
      }
    }
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

WriteResult
RegionWriter::writeTables(const cv::Mat &pageImage, int pageNumber,
                          const std::vector<CandidateRegion> &tables) const {
  WriteResult result;
  result.success = true;

  if (pageImage.empty()) {
    result.success = false;
    result.errorMessage = "Page image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();
  std::filesystem::path cropsDir =
      std::filesystem::path(m_config.outputDir) / "crops";

  for (size_t i = 0; i < tables.size(); i++) {
    const CandidateRegion &table = tables[i];
    cv::Rect cropRect = table.boundingBox.expanded(m_config.cropPadding)
                            .toPixels(pageImage.size());
    if (cropRect.empty()) {
      continue;
    }

    std::string fileName =
        m_config.filePrefix + tableFileName(pageNumber, static_cast<int>(i) + 1);
    std::string outPath = (cropsDir / fileName).string();

    try {
      if (!cv::imwrite(outPath, pageImage(cropRect))) {
        result.success = false;
        result.errorMessage = "Failed to write " + outPath;
        continue;
      }
    } catch (const cv::Exception &e) {
      result.success = false;
      result.errorMessage = "Failed to write " + outPath + ": " + e.what();
      continue;
    }
    result.writtenFiles.push_back(outPath);

    if (m_config.writeSidecars) {
      std::string error;
      if (writeSidecar(outPath, fileName, {}, pageNumber, table.boundingBox,
                       "table", table.confidence, error)) {
        result.writtenFiles.push_back(replaceExtension(outPath, ".json"));
      } else {
        result.success = false;
        result.errorMessage = error;
      }
    }
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

WriteResult RegionWriter::writeTableOverlay(
    const cv::Mat &pageImage, int pageNumber,
    const std::vector<CandidateRegion> &tables) const {
  WriteResult result;

  if (pageImage.empty()) {
    result.errorMessage = "Page image is empty";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  cv::Mat overlay = pageImage.clone();
  for (const auto &table : tables) {
    cv::Rect box = table.boundingBox.toPixels(overlay.size());
    if (box.empty()) {
      continue;
    }
    cv::rectangle(overlay, box, cv::Scalar(0, 0, 255), 3);

    if (table.confidence) {
      std::ostringstream text;
      text << std::fixed << std::setprecision(2) << *table.confidence;
      cv::Point origin(box.x, std::max(box.y - 10, 20));
      cv::putText(overlay, text.str(), origin, cv::FONT_HERSHEY_SIMPLEX, 1.0,
                  cv::Scalar(0, 0, 255), 2);
    }
  }

  std::string outPath =
      (std::filesystem::path(m_config.outputDir) / "debug" /
       (m_config.filePrefix + overlayFileName(pageNumber)))
          .string();

  try {
    if (cv::imwrite(outPath, overlay)) {
      result.success = true;
      result.writtenFiles.push_back(outPath);
    } else {
      result.errorMessage = "Failed to write " + outPath;
    }
  } catch (const cv::Exception &e) {
    result.errorMessage = "Failed to write " + outPath + ": " + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

void RegionWriter::drawLabels(cv::Mat &crop, const cv::Rect &cropRect,
                              const std::vector<Label> &labels) const {
  double zoom = m_config.dpi / 72.0;

  for (const auto &label : labels) {
    Rect box = label.boundingBox.scaled(zoom);

    // Hershey simplex is about 22 px tall at scale 1
    double fontScale = std::max(0.4, box.height() / 22.0);
    int thickness = std::max(1, static_cast<int>(std::lround(fontScale)));

    // putText anchors at the baseline, i.e. the bottom-left of the label
    cv::Point origin(static_cast<int>(std::lround(box.x0())) - cropRect.x,
                     static_cast<int>(std::lround(box.y1())) - cropRect.y);
    origin.x = std::clamp(origin.x, 0, std::max(0, crop.cols - 1));
    origin.y = std::clamp(origin.y, 0, std::max(0, crop.rows - 1));

    cv::putText(crop, label.text, origin, cv::FONT_HERSHEY_SIMPLEX, fontScale,
                cv::Scalar(0, 0, 255), thickness);
  }
}

bool RegionWriter::writeSidecar(const std::string &pngPath,
                                const std::string &fileName,
                                const std::vector<std::string> &labels,
                                int pageNumber, const Rect &bbox,
                                const std::string &type,
                                const std::optional<double> &score,
                                std::string &errorMessage) const {
  std::string jsonPath = replaceExtension(pngPath, ".json");

  try {
    cv::FileStorage fs(jsonPath,
                       cv::FileStorage::WRITE | cv::FileStorage::FORMAT_JSON);
    if (!fs.isOpened()) {
      errorMessage = "Failed to open " + jsonPath;
      return false;
    }

    // Strings go through write() so values starting with '[' or '{' are not
    // taken for structure markers
    fs.write("file", fileName);

    fs.startWriteStruct("labels", cv::FileNode::SEQ);
    for (const auto &label : labels) {
      fs.write(std::string(), label);
    }
    fs.endWriteStruct();

    fs.write("page", pageNumber);

    fs.startWriteStruct("bbox", cv::FileNode::SEQ | cv::FileNode::FLOW);
    fs.write(std::string(), bbox.x0());
    fs.write(std::string(), bbox.y0());
    fs.write(std::string(), bbox.x1());
    fs.write(std::string(), bbox.y1());
    fs.endWriteStruct();

    fs.write("type", type);
    if (score) {
      fs.write("score", *score);
    }

    fs.release();
  } catch (const cv::Exception &e) {
    errorMessage = "Failed to write " + jsonPath + ": " + e.what();
    return false;
  }

  return true;
}

} // namespace regions
