#include "RegionWriter.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <cmath>
#include <filesystem>
#include <iostream>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition)
    failures++;
}

using namespace regions;

int main() {
  std::filesystem::path outDir =
      std::filesystem::temp_directory_path() / "regions_writer_test";
  std::filesystem::remove_all(outDir);

  std::cout << "=== Test file names ===" << std::endl;
  {
    check(RegionWriter::diagramFileName(3, 1) == "page3_diagram1.png",
          "diagram file name");
    check(RegionWriter::tableFileName(1, 2) == "page0001_table02.png",
          "table file name is zero padded");
    check(RegionWriter::overlayFileName(12) == "page0012_debug.png",
          "overlay file name");
  }

  std::cout << std::endl << "=== Test pixel mapping ===" << std::endl;
  {
    RegionWriterConfig config;
    config.dpi = 144;
    RegionWriter writer(config);
    check(writer.toPixelRect(Rect(10, 10, 20, 20), cv::Size(1000, 1000)) ==
              cv::Rect(20, 20, 20, 20),
          "points scaled by dpi / 72");
    check(writer.toPixelRect(Rect(490, 0, 600, 10), cv::Size(1000, 1000)) ==
              cv::Rect(980, 0, 20, 20),
          "crop clipped to the page image");
  }

  RegionWriterConfig config;
  config.outputDir = outDir.string();
  config.filePrefix = "sheet_";
  config.dpi = 72;
  config.cropPadding = 10;
  RegionWriter writer(config);

  std::string error;
  check(writer.prepare(error), "output directories created");
  check(std::filesystem::is_directory(outDir / "crops") &&
            std::filesystem::is_directory(outDir / "debug"),
        "crops and debug directories exist");

  cv::Mat page(300, 400, CV_8UC3, cv::Scalar(255, 255, 255));
  cv::circle(page, cv::Point(60, 35), 20, cv::Scalar(0, 0, 0), 2);

  std::cout << std::endl << "=== Test diagram crops ===" << std::endl;
  {
    ExtractedRegion region;
    region.boundingBox = Rect(10, 10, 110, 60);
    Label label;
    label.text = "[A1]";
    label.boundingBox = Rect(20, 40, 40, 50);
    region.labels.push_back(label);

    auto result = writer.writeDiagrams(page, 3, {region});
    check(result.success, "diagram written");
    check(result.writtenFiles.size() == 2, "crop and sidecar written");

    std::string pngPath = (outDir / "page3_diagram1.png").string();
    cv::Mat crop = cv::imread(pngPath);
    check(!crop.empty() && crop.cols == 100 && crop.rows == 50,
          "crop matches the region");

    // Label drawn in red somewhere in the crop
    bool hasRed = false;
    for (int y = 0; y < crop.rows && !hasRed; y++) {
      for (int x = 0; x < crop.cols; x++) {
        cv::Vec3b px = crop.at<cv::Vec3b>(y, x);
        if (px[2] > 200 && px[0] < 80 && px[1] < 80) {
          hasRed = true;
          break;
        }
      }
    }
    check(hasRed, "label drawn in red");

    cv::FileStorage fs((outDir / "page3_diagram1.json").string(),
                       cv::FileStorage::READ);
    check(fs.isOpened(), "sidecar readable");
    if (fs.isOpened()) {
      check(static_cast<std::string>(fs["file"]) == "page3_diagram1.png",
            "sidecar file");
      check(fs["labels"].size() == 1 &&
                static_cast<std::string>(fs["labels"][0]) == "[A1]",
            "sidecar labels");
      check(static_cast<int>(fs["page"]) == 3, "sidecar page");
      check(fs["bbox"].size() == 4 &&
                static_cast<double>(fs["bbox"][2]) == 110.0,
            "sidecar bbox");
      check(static_cast<std::string>(fs["type"]) == "merged", "sidecar type");
    }

    ExtractedRegion outside;
    outside.boundingBox = Rect(500, 500, 600, 600);
    auto skipped = writer.writeDiagrams(page, 4, {outside});
    check(skipped.success && skipped.writtenFiles.empty(),
          "region outside the image is skipped");

    check(!writer.writeDiagrams(cv::Mat(), 5, {region}).success,
          "empty page image fails");
  }

  std::cout << std::endl << "=== Test table crops ===" << std::endl;
  {
    CandidateRegion table;
    table.boundingBox = Rect(50, 50, 100, 100);
    table.source = CandidateSource::Detector;
    table.confidence = 0.87;

    auto result = writer.writeTables(page, 1, {table});
    check(result.success, "table written");

    cv::Mat crop =
        cv::imread((outDir / "crops" / "sheet_page0001_table01.png").string());
    check(!crop.empty() && crop.cols == 70 && crop.rows == 70,
          "crop padded by 10 pixels");

    cv::FileStorage fs(
        (outDir / "crops" / "sheet_page0001_table01.json").string(),
        cv::FileStorage::READ);
    check(fs.isOpened() && static_cast<std::string>(fs["type"]) == "table",
          "table sidecar type");
    check(fs.isOpened() && std::abs(static_cast<double>(fs["score"]) - 0.87) <
                               1e-9,
          "table sidecar score");

    auto overlay = writer.writeTableOverlay(page, 1, {table});
    check(overlay.success, "overlay written");
    check(std::filesystem::exists(outDir / "debug" /
                                  "sheet_page0001_debug.png"),
          "overlay file exists");
  }

  std::filesystem::remove_all(outDir);

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
