#include "ScannedPageSource.hpp"

#include <opencv2/imgproc.hpp>

#include <cmath>
#include <iostream>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition)
    failures++;
}

using namespace regions;

// Line art: circle with a cross and a bolt hole pattern
static void drawFigure(cv::Mat &image, cv::Point center) {
  cv::Scalar black(0, 0, 0);
  cv::circle(image, center, 80, black, 2);
  cv::line(image, center - cv::Point(90, 0), center + cv::Point(90, 0), black,
           1);
  cv::line(image, center - cv::Point(0, 90), center + cv::Point(0, 90), black,
           1);
  for (int i = 0; i < 4; i++) {
    cv::Point offset((i % 2 == 0 ? 50 : -50), (i < 2 ? 50 : -50));
    cv::circle(image, center + offset, 10, black, 2);
  }
}

int main() {
  ScannedPageConfig config;
  config.dpi = 100;
  ScannedPageSource source(config);

  std::cout << "=== Test page size ===" << std::endl;
  {
    cv::Mat blank(1100, 850, CV_8UC3, cv::Scalar(255, 255, 255));
    auto result = source.analyzePage(blank, 4);
    check(result.success, "blank page analysed");
    check(result.page.pageNumber == 4, "page number kept");
    check(std::abs(result.page.width - 612.0) < 1e-9 &&
              std::abs(result.page.height - 792.0) < 1e-9,
          "850 x 1100 pixels at 100 dpi is 612 x 792 points");
    check(result.page.images.empty() && result.page.drawings.empty() &&
              result.page.textSpans.empty(),
          "blank page has no content");

    check(!source.analyzePage(cv::Mat()).success, "empty image fails");
    check(!source.loadImage("/nonexistent/page.png").success,
          "missing file fails");
  }

  std::cout << std::endl << "=== Test graphic blocks ===" << std::endl;
  {
    cv::Mat page(1100, 850, CV_8UC3, cv::Scalar(255, 255, 255));
    drawFigure(page, cv::Point(400, 500));

    auto blocks = source.findGraphicBlocks(page, {});
    check(blocks.size() == 1, "figure found as one block");
    if (blocks.size() == 1) {
      check(blocks[0].contains(cv::Point(320, 420)) &&
                blocks[0].contains(cv::Point(480, 580)),
            "block covers the figure");
      check(blocks[0].width < 260 && blocks[0].height < 260,
            "block stays close to the figure");
    }

    auto result = source.analyzePage(page, 1);
    check(result.success && result.page.images.size() == 1,
          "block reported as an image");
    if (result.page.images.size() == 1) {
      const Rect &box = result.page.images[0].boundingBox;
      check(box.contains(Rect(320 * 0.72, 420 * 0.72, 480 * 0.72,
                              580 * 0.72)),
            "image block converted to points");
    }
  }

  std::cout << std::endl << "=== Test text masking ===" << std::endl;
  {
    cv::Mat page(1100, 850, CV_8UC3, cv::Scalar(255, 255, 255));
    drawFigure(page, cv::Point(400, 500));

    // A recognized word box over the whole figure blanks it out
    std::vector<cv::Rect> words = {cv::Rect(300, 400, 200, 200)};
    check(source.findGraphicBlocks(page, words).empty(),
          "masked graphic is ignored");
  }

  std::cout << std::endl << "=== Test size limits ===" << std::endl;
  {
    cv::Mat page(1100, 850, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::circle(page, cv::Point(200, 200), 8, cv::Scalar(0, 0, 0), 2);
    check(source.findGraphicBlocks(page, {}).empty(),
          "mark smaller than the minimum block is ignored");
  }

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
