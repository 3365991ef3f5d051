#ifndef REGIONS_REGION_CONFIG_HPP
#define REGIONS_REGION_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief How candidate rectangles are clustered
 */
enum class MergeMode {
  SinglePass, ///< One greedy pass, first match absorbs (order dependent)
  FixedPoint  ///< Repeat the greedy pass until no further merge happens
};

/**
 * @brief Thresholds of the vector drawing classifier
 *
 * The classifier is a heuristic: these values trade false positives against
 * false negatives and have no ground truth behind them.
 */
struct ClassifierThresholds {
  int bannerMinLines = 20; ///< Grid reject: more lines than this...
  int bannerMinRects = 10; ///< ...and more rectangles than this...
  int bannerMaxCurves = 2; ///< ...and fewer curves than this
  double bannerMinWidth = 400.0;  ///< Rule reject: wider than this...
  double bannerMaxHeight = 150.0; ///< ...and shorter than this
  int minCurves = 3;              ///< Accept when at least this many curves
  int minPrimitives = 5; ///< Otherwise accept when more primitives than this
};

/**
 * @brief Configuration of the region engine
 *
 * Distances and sizes are in page units (points for PDF pages).
 */
struct RegionConfig {
  ClassifierThresholds classifier;

  double headerFraction = 0.10; ///< Top band of the page excluded (0-1)
  double footerFraction = 0.15; ///< Bottom band of the page excluded (0-1)

  double minImageWidth = 80.0;  ///< Smallest raster block considered
  double minImageHeight = 80.0; ///< Smallest raster block considered

  double mergeDistance = 40.0; ///< Gap below which candidates merge
  MergeMode mergeMode = MergeMode::SinglePass;

  bool removeOuterRegions = true; ///< Drop regions containing other regions
  double minAreaRatio = 0.1; ///< Size filter ratio to largest (0 disables)

  double labelDistance = 50.0;   ///< Max gap between a label and its region
  std::size_t minLabelLength = 2;  ///< In characters
  std::size_t maxLabelLength = 20; ///< In characters
  std::vector<std::string> labelDenylist = {"THK",  "TABLE", "DIM", "NOTE",
                                            "CFS",  "CF",    "NUCF"};
  bool exclusiveLabels = true; ///< A label binds only to the first region

  std::string tableLabelToken = "table"; ///< Detector label substring
  double minTableScore = 0.23;           ///< Detector score threshold
  double containmentThreshold = 1.0; ///< Covered fraction making a box outer

  int cropPadding = 10; ///< Pixels added around table crops
  bool skipTablePages = true; ///< Diagram mode skips pages holding tables

  bool debug = false; ///< Print DEBUG diagnostics to stderr
};

/**
 * @brief Overlay configuration values from a YAML or JSON file
 *
 * Keys use the field names of RegionConfig; classifier thresholds live under a
 * "classifier" map and mergeMode is "single_pass" or "fixed_point". Keys that
 * are absent keep their current value.
 *
 * @param path Path to the configuration file
 * @param config Configuration to update
 * @param errorMessage Set when loading fails
 * @return true on success
 */
bool loadRegionConfig(const std::string &path, RegionConfig &config,
                      std::string &errorMessage);

const char *getMergeModeString(MergeMode mode);

} // namespace regions

#endif // REGIONS_REGION_CONFIG_HPP
