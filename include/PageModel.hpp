#ifndef REGIONS_PAGE_MODEL_HPP
#define REGIONS_PAGE_MODEL_HPP

#include "Geometry.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace regions {

/// Straight segment of a vector path
struct LineShape {
  Rect boundingBox;
};

/// Closed axis-aligned four-corner path
struct RectShape {
  Rect boundingBox;
};

/// Bezier segment (bounding box of its control polygon)
struct CurveShape {
  Rect boundingBox;
};

/**
 * @brief One geometric primitive decomposed from a vector drawing
 */
using PrimitiveShape = std::variant<LineShape, RectShape, CurveShape>;

Rect boundingBoxOf(const PrimitiveShape &shape);

/**
 * @brief The primitives of a single vector drawing (one painted path)
 */
struct ShapeCluster {
  Rect boundingBox;                   ///< Drawing bounds reported by the source
  std::vector<PrimitiveShape> shapes; ///< Decomposed primitives
};

/**
 * @brief A raster image placed on the page
 */
struct ImageBlock {
  Rect boundingBox;
};

/**
 * @brief A run of text with its position on the page
 */
struct TextSpan {
  std::string text; ///< UTF-8 text
  Rect boundingBox; ///< Bounds in page coordinates
};

/**
 * @brief Everything the region engine needs to know about one page
 *
 * Supplied by a page source (PDF or scanned image). Coordinates of all members
 * share the unit of width/height, origin top-left.
 */
struct PageContent {
  int pageNumber = 1;                 ///< 1-indexed page number
  double width = 0.0;                 ///< Page width
  double height = 0.0;                ///< Page height
  std::vector<ShapeCluster> drawings; ///< Vector drawings
  std::vector<ImageBlock> images;     ///< Placed raster images
  std::vector<TextSpan> textSpans;    ///< Text spans in scan order

  Rect pageRect() const;
};

/**
 * @brief Result of loading one page from a page source
 */
struct PageLoadResult {
  bool success = false;        ///< Whether the page was loaded
  std::string errorMessage;    ///< Error message if failed
  PageContent page;            ///< Page content on success
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Where a candidate region came from
 */
enum class CandidateSource {
  Vector,  ///< Accepted vector drawing
  Image,   ///< Raster image block
  Detector ///< Object detector box (tables)
};

const char *getCandidateSourceString(CandidateSource source);

/**
 * @brief A proposed region before merging and filtering
 */
struct CandidateRegion {
  Rect boundingBox;
  CandidateSource source = CandidateSource::Vector;
  std::optional<double> confidence; ///< Only set for detector boxes
};

/**
 * @brief Box reported by a layout/table detector
 */
struct Detection {
  Rect boundingBox;
  double score = 0.0; ///< Detector confidence (0-1)
  std::string label;  ///< Class name reported by the detector
};

/**
 * @brief Short text annotating a region
 */
struct Label {
  std::string text;
  Rect boundingBox;
};

/**
 * @brief Final region with the labels attached to it
 */
struct ExtractedRegion {
  Rect boundingBox;
  std::vector<Label> labels; ///< In page scan order
};

} // namespace regions

#endif // REGIONS_PAGE_MODEL_HPP
