#include "PDFPageSource.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

// Poppler low-level API for path and image callbacks
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Page.h>
#include <Stream.h>
#include <goo/GooString.h>

namespace regions {

// Custom OutputDev collecting painted paths and placed images of a page
namespace {

class ShapeCollectorOutputDev : public OutputDev {
public:
  ShapeCollectorOutputDev() = default;

  std::vector<ShapeCluster> &getDrawings() { return drawings; }
  std::vector<ImageBlock> &getImages() { return images; }

  // Device space with the origin at the top-left, y downward
  bool upsideDown() override { return true; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void stroke(GfxState *state) override { collectPath(state); }
  void fill(GfxState *state) override { collectPath(state); }
  void eoFill(GfxState *state) override { collectPath(state); }

  void drawImage(GfxState *state, Object * /*ref*/, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool /*interpolate*/,
                 const int * /*maskColors*/, bool inlineImg) override {
    // Inline image data sits in the content stream and must be consumed
    if (inlineImg && colorMap) {
      ImageStream imgStr(str, width, colorMap->getNumPixelComps(),
                         colorMap->getBits());
      imgStr.reset();
      for (int row = 0; row < height; row++) {
        imgStr.getLine();
      }
      imgStr.close();
    }

    if (width <= 0 || height <= 0) {
      return;
    }

    // The CTM maps the unit square onto the placed image; rotated images
    // are reported by their axis-aligned bounding box
    const auto &ctm = state->getCTM();
    double xs[4] = {ctm[4], ctm[4] + ctm[0], ctm[4] + ctm[2],
                    ctm[4] + ctm[0] + ctm[2]};
    double ys[4] = {ctm[5], ctm[5] + ctm[1], ctm[5] + ctm[3],
                    ctm[5] + ctm[1] + ctm[3]};

    double minX = *std::min_element(xs, xs + 4);
    double maxX = *std::max_element(xs, xs + 4);
    double minY = *std::min_element(ys, ys + 4);
    double maxY = *std::max_element(ys, ys + 4);

    if (!Rect::isWellFormed(minX, minY, maxX, maxY)) {
      return;
    }

    ImageBlock block;
    block.boundingBox = Rect(minX, minY, maxX, maxY);
    images.push_back(block);
  }

private:
  void collectPath(GfxState *state) {
    const GfxPath *path = state->getPath();
    if (!path)
      return;

    const auto &ctm = state->getCTM();
    auto toPage = [&ctm](double x, double y) {
      return cv::Point2d(ctm[0] * x + ctm[2] * y + ctm[4],
                         ctm[1] * x + ctm[3] * y + ctm[5]);
    };

    ShapeCluster cluster;

    for (int i = 0; i < path->getNumSubpaths(); i++) {
      const GfxSubpath *subpath = path->getSubpath(i);
      int numPoints = subpath->getNumPoints();
      if (numPoints < 2)
        continue;

      std::vector<cv::Point2d> points;
      points.reserve(numPoints);
      for (int j = 0; j < numPoints; j++) {
        points.push_back(toPage(subpath->getX(j), subpath->getY(j)));
      }

      if (isRectangle(subpath, points)) {
        Rect box = Rect::fromPoints(points[0], points[0]);
        for (int j = 1; j < 4; j++) {
          box = box.united(Rect::fromPoints(points[j], points[j]));
        }
        cluster.shapes.push_back(RectShape{box});
        continue;
      }

      // Bezier segments are stored as start, two control points, end; the
      // control points are flagged as curve points
      int j = 0;
      while (j < numPoints - 1) {
        if (j + 3 < numPoints && subpath->getCurve(j + 1)) {
          Rect box = Rect::fromPoints(points[j], points[j + 3]);
          box = box.united(Rect::fromPoints(points[j + 1], points[j + 2]));
          cluster.shapes.push_back(CurveShape{box});
          j += 3;
        } else {
          cluster.shapes.push_back(
              LineShape{Rect::fromPoints(points[j], points[j + 1])});
          j += 1;
        }
      }
    }

    if (cluster.shapes.empty())
      return;

    cluster.boundingBox = boundingBoxOf(cluster.shapes.front());
    for (const auto &shape : cluster.shapes) {
      cluster.boundingBox = cluster.boundingBox.united(boundingBoxOf(shape));
    }

    // Fill-and-stroke paints the same path twice
    if (!drawings.empty() &&
        drawings.back().boundingBox == cluster.boundingBox &&
        drawings.back().shapes.size() == cluster.shapes.size()) {
      return;
    }

    drawings.push_back(std::move(cluster));
  }

  static bool isRectangle(const GfxSubpath *subpath,
                          const std::vector<cv::Point2d> &points) {
    // 4 corners, possibly with the closing point repeated
    int numPoints = static_cast<int>(points.size());
    if (numPoints < 4 || numPoints > 5)
      return false;
    if (!subpath->isClosed() && numPoints != 5)
      return false;

    for (int j = 0; j < numPoints; j++) {
      if (subpath->getCurve(j))
        return false;
    }

    // Axis-aligned: exactly 2 distinct X and 2 distinct Y values
    const double tolerance = 0.5; // Half a point
    std::vector<double> xVals, yVals;
    for (int i = 0; i < 4; i++) {
      auto near = [&](double v) {
        return [v, tolerance](double other) {
          return std::abs(v - other) < tolerance;
        };
      };
      if (std::none_of(xVals.begin(), xVals.end(), near(points[i].x)))
        xVals.push_back(points[i].x);
      if (std::none_of(yVals.begin(), yVals.end(), near(points[i].y)))
        yVals.push_back(points[i].y);
    }

    return xVals.size() == 2 && yVals.size() == 2;
  }

  std::vector<ShapeCluster> drawings;
  std::vector<ImageBlock> images;
};

cv::Mat toBgrMat(const poppler::image &popplerImage) {
  int width = popplerImage.width();
  int height = popplerImage.height();
  char *data = const_cast<char *>(popplerImage.const_data());
  size_t step = static_cast<size_t>(popplerImage.bytes_per_row());

  cv::Mat mat;
  switch (popplerImage.format()) {
  case poppler::image::format_argb32:
    // ARGB32 is stored as BGRA bytes on little-endian machines
    cv::cvtColor(cv::Mat(height, width, CV_8UC4, data, step), mat,
                 cv::COLOR_BGRA2BGR);
    break;
  case poppler::image::format_rgb24:
    cv::cvtColor(cv::Mat(height, width, CV_8UC3, data, step), mat,
                 cv::COLOR_RGB2BGR);
    break;
  case poppler::image::format_bgr24:
    mat = cv::Mat(height, width, CV_8UC3, data, step).clone();
    break;
  case poppler::image::format_gray8:
    cv::cvtColor(cv::Mat(height, width, CV_8UC1, data, step), mat,
                 cv::COLOR_GRAY2BGR);
    break;
  default:
    break;
  }
  return mat;
}

} // anonymous namespace

struct PDFPageSource::Impl {
  std::string path;
  std::string errorMessage;
  // GlobalParamsIniter is a RAII class that manages Poppler's global state;
  // it must outlive the documents
  std::unique_ptr<GlobalParamsIniter> globalParams;
  std::unique_ptr<PDFDoc> doc;
  std::unique_ptr<poppler::document> document;
};

PDFPageSource::PDFPageSource() : m_impl(std::make_unique<Impl>()) {}

PDFPageSource::~PDFPageSource() = default;

PDFPageSource::PDFPageSource(PDFPageSource &&other) noexcept = default;

PDFPageSource &PDFPageSource::operator=(PDFPageSource &&other) noexcept =
    default;

bool PDFPageSource::open(const std::string &pdfPath) {
  if (!m_impl) {
    m_impl = std::make_unique<Impl>();
  }
  m_impl->document.reset();
  m_impl->doc.reset();
  m_impl->path = pdfPath;
  m_impl->errorMessage.clear();

  try {
    if (!m_impl->globalParams) {
      m_impl->globalParams = std::make_unique<GlobalParamsIniter>(nullptr);
    }

    m_impl->document.reset(poppler::document::load_from_file(pdfPath));
    if (!m_impl->document) {
      m_impl->errorMessage = "Failed to load PDF file: " + pdfPath;
      return false;
    }
    if (m_impl->document->is_locked()) {
      m_impl->errorMessage = "PDF file is password protected: " + pdfPath;
      m_impl->document.reset();
      return false;
    }

    auto fileName = std::make_unique<GooString>(pdfPath);
    m_impl->doc.reset(new PDFDoc(std::move(fileName)));
    if (!m_impl->doc->isOk()) {
      m_impl->errorMessage = "Failed to parse PDF file: " + pdfPath;
      m_impl->doc.reset();
      m_impl->document.reset();
      return false;
    }

  } catch (const std::exception &e) {
    m_impl->errorMessage = std::string("Failed to open PDF: ") + e.what();
    m_impl->doc.reset();
    m_impl->document.reset();
    return false;
  }

  return true;
}

bool PDFPageSource::isOpen() const {
  return m_impl && m_impl->doc && m_impl->document;
}

const std::string &PDFPageSource::getErrorMessage() const {
  static const std::string empty;
  return m_impl ? m_impl->errorMessage : empty;
}

int PDFPageSource::pageCount() const {
  return isOpen() ? m_impl->doc->getNumPages() : 0;
}

PageLoadResult PDFPageSource::loadPage(int pageNumber) {
  PageLoadResult result;

  if (!isOpen()) {
    result.errorMessage = "No PDF document is open";
    return result;
  }
  if (pageNumber < 1 || pageNumber > pageCount()) {
    result.errorMessage = "Page " + std::to_string(pageNumber) +
                          " out of range (1-" + std::to_string(pageCount()) +
                          ")";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    PageContent &page = result.page;
    page.pageNumber = pageNumber;

    double mediaWidth = m_impl->doc->getPageMediaWidth(pageNumber);
    double mediaHeight = m_impl->doc->getPageMediaHeight(pageNumber);
    int rotation = m_impl->doc->getPageRotate(pageNumber);
    if (rotation == 90 || rotation == 270) {
      std::swap(mediaWidth, mediaHeight);
    }
    page.width = mediaWidth;
    page.height = mediaHeight;

    ShapeCollectorOutputDev outputDev;
    m_impl->doc->displayPage(&outputDev, pageNumber, 72.0, 72.0, // DPI
                             0,                                  // rotation
                             true,   // useMediaBox
                             false,  // crop
                             false); // printing

    page.drawings = std::move(outputDev.getDrawings());
    page.images = std::move(outputDev.getImages());

    std::unique_ptr<poppler::page> popplerPage(
        m_impl->document->create_page(pageNumber - 1));
    if (!popplerPage) {
      result.errorMessage =
          "Failed to create page " + std::to_string(pageNumber);
      return result;
    }

    // text_list() reports boxes in top-left page space
    for (auto &textBox : popplerPage->text_list()) {
      poppler::byte_array textBytes = textBox.text().to_utf8();
      std::string text(textBytes.begin(), textBytes.end());
      if (text.empty()) {
        continue;
      }

      poppler::rectf bbox = textBox.bbox();
      double x0 = bbox.x();
      double y0 = bbox.y();
      double x1 = bbox.x() + bbox.width();
      double y1 = bbox.y() + bbox.height();
      if (!Rect::isWellFormed(x0, y0, x1, y1)) {
        continue;
      }

      TextSpan span;
      span.text = text;
      span.boundingBox = Rect(x0, y0, x1, y1);
      page.textSpans.push_back(span);
    }

    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page extraction failed: ") +
                          e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

PageRenderResult PDFPageSource::renderPage(int pageNumber, double dpi) {
  PageRenderResult result;
  result.dpi = dpi;

  if (!isOpen()) {
    result.errorMessage = "No PDF document is open";
    return result;
  }
  if (pageNumber < 1 || pageNumber > pageCount()) {
    result.errorMessage =
        "Page " + std::to_string(pageNumber) + " out of range";
    return result;
  }
  if (dpi <= 0) {
    result.errorMessage = "DPI must be positive";
    return result;
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::page> page(
        m_impl->document->create_page(pageNumber - 1));
    if (!page) {
      result.errorMessage =
          "Failed to create page " + std::to_string(pageNumber);
      return result;
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);
    if (!popplerImage.is_valid()) {
      result.errorMessage = "Failed to render page " +
                            std::to_string(pageNumber);
      return result;
    }

    result.image = toBgrMat(popplerImage);
    if (result.image.empty()) {
      result.errorMessage = "Unsupported image format";
      return result;
    }

    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page rendering failed: ") +
                          e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace regions
