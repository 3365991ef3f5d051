#include "RegionConfig.hpp"

#include <opencv2/core.hpp>

namespace regions {

namespace {

bool readDouble(const cv::FileNode &parent, const char *key, double &value,
                std::string &errorMessage) {
  cv::FileNode node = parent[key];
  if (node.empty() || node.isNone()) {
    return true;
  }
  if (!node.isReal() && !node.isInt()) {
    errorMessage = std::string("Expected a number for '") + key + "'";
    return false;
  }
  value = static_cast<double>(node);
  return true;
}

bool readInt(const cv::FileNode &parent, const char *key, int &value,
             std::string &errorMessage) {
  cv::FileNode node = parent[key];
  if (node.empty() || node.isNone()) {
    return true;
  }
  if (!node.isInt()) {
    errorMessage = std::string("Expected an integer for '") + key + "'";
    return false;
  }
  value = static_cast<int>(node);
  return true;
}

bool readSize(const cv::FileNode &parent, const char *key, std::size_t &value,
              std::string &errorMessage) {
  int raw = static_cast<int>(value);
  if (!readInt(parent, key, raw, errorMessage)) {
    return false;
  }
  if (raw < 0) {
    errorMessage = std::string("Expected a non-negative value for '") + key +
                   "'";
    return false;
  }
  value = static_cast<std::size_t>(raw);
  return true;
}

// FileStorage has no boolean type; flags are stored as 0/1
bool readBool(const cv::FileNode &parent, const char *key, bool &value,
              std::string &errorMessage) {
  int raw = value ? 1 : 0;
  if (!readInt(parent, key, raw, errorMessage)) {
    return false;
  }
  value = raw != 0;
  return true;
}

bool readString(const cv::FileNode &parent, const char *key,
                std::string &value, std::string &errorMessage) {
  cv::FileNode node = parent[key];
  if (node.empty() || node.isNone()) {
    return true;
  }
  if (!node.isString()) {
    errorMessage = std::string("Expected a string for '") + key + "'";
    return false;
  }
  value = static_cast<std::string>(node);
  return true;
}

bool readStringList(const cv::FileNode &parent, const char *key,
                    std::vector<std::string> &value,
                    std::string &errorMessage) {
  cv::FileNode node = parent[key];
  if (node.empty() || node.isNone()) {
    return true;
  }
  if (!node.isSeq()) {
    errorMessage = std::string("Expected a list for '") + key + "'";
    return false;
  }

  std::vector<std::string> items;
  for (cv::FileNodeIterator it = node.begin(); it != node.end(); ++it) {
    if (!(*it).isString()) {
      errorMessage = std::string("Expected strings in '") + key + "'";
      return false;
    }
    items.push_back(static_cast<std::string>(*it));
  }
  value = items;
  return true;
}

bool readFraction(const cv::FileNode &parent, const char *key, double &value,
                  std::string &errorMessage) {
  double raw = value;
  if (!readDouble(parent, key, raw, errorMessage)) {
    return false;
  }
  if (raw < 0.0 || raw > 1.0) {
    errorMessage = std::string("'") + key + "' must be between 0 and 1";
    return false;
  }
  value = raw;
  return true;
}

bool readClassifier(const cv::FileNode &root, ClassifierThresholds &thresholds,
                    std::string &errorMessage) {
  cv::FileNode node = root["classifier"];
  if (node.empty() || node.isNone()) {
    return true;
  }
  if (!node.isMap()) {
    errorMessage = "Expected a map for 'classifier'";
    return false;
  }

  return readInt(node, "bannerMinLines", thresholds.bannerMinLines,
                 errorMessage) &&
         readInt(node, "bannerMinRects", thresholds.bannerMinRects,
                 errorMessage) &&
         readInt(node, "bannerMaxCurves", thresholds.bannerMaxCurves,
                 errorMessage) &&
         readDouble(node, "bannerMinWidth", thresholds.bannerMinWidth,
                    errorMessage) &&
         readDouble(node, "bannerMaxHeight", thresholds.bannerMaxHeight,
                    errorMessage) &&
         readInt(node, "minCurves", thresholds.minCurves, errorMessage) &&
         readInt(node, "minPrimitives", thresholds.minPrimitives,
                 errorMessage);
}

bool readMergeMode(const cv::FileNode &root, MergeMode &mode,
                   std::string &errorMessage) {
  std::string name;
  if (!readString(root, "mergeMode", name, errorMessage)) {
    return false;
  }
  if (name.empty()) {
    return true;
  }
  if (name == "single_pass") {
    mode = MergeMode::SinglePass;
  } else if (name == "fixed_point") {
    mode = MergeMode::FixedPoint;
  } else {
    errorMessage = "Unknown mergeMode: " + name;
    return false;
  }
  return true;
}

} // anonymous namespace

bool loadRegionConfig(const std::string &path, RegionConfig &config,
                      std::string &errorMessage) {
  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      errorMessage = "Failed to open configuration file: " + path;
      return false;
    }

    cv::FileNode root = fs.root();

    // Parse into a copy so a failure leaves the caller's config untouched
    RegionConfig loaded = config;
    bool ok =
        readClassifier(root, loaded.classifier, errorMessage) &&
        readFraction(root, "headerFraction", loaded.headerFraction,
                     errorMessage) &&
        readFraction(root, "footerFraction", loaded.footerFraction,
                     errorMessage) &&
        readDouble(root, "minImageWidth", loaded.minImageWidth,
                   errorMessage) &&
        readDouble(root, "minImageHeight", loaded.minImageHeight,
                   errorMessage) &&
        readDouble(root, "mergeDistance", loaded.mergeDistance,
                   errorMessage) &&
        readMergeMode(root, loaded.mergeMode, errorMessage) &&
        readBool(root, "removeOuterRegions", loaded.removeOuterRegions,
                 errorMessage) &&
        readFraction(root, "minAreaRatio", loaded.minAreaRatio,
                     errorMessage) &&
        readDouble(root, "labelDistance", loaded.labelDistance,
                   errorMessage) &&
        readSize(root, "minLabelLength", loaded.minLabelLength,
                 errorMessage) &&
        readSize(root, "maxLabelLength", loaded.maxLabelLength,
                 errorMessage) &&
        readStringList(root, "labelDenylist", loaded.labelDenylist,
                       errorMessage) &&
        readBool(root, "exclusiveLabels", loaded.exclusiveLabels,
                 errorMessage) &&
        readString(root, "tableLabelToken", loaded.tableLabelToken,
                   errorMessage) &&
        readDouble(root, "minTableScore", loaded.minTableScore,
                   errorMessage) &&
        readFraction(root, "containmentThreshold",
                     loaded.containmentThreshold, errorMessage) &&
        readInt(root, "cropPadding", loaded.cropPadding, errorMessage) &&
        readBool(root, "skipTablePages", loaded.skipTablePages,
                 errorMessage) &&
        readBool(root, "debug", loaded.debug, errorMessage);

    if (!ok) {
      errorMessage = path + ": " + errorMessage;
      return false;
    }

    if (loaded.minLabelLength > loaded.maxLabelLength) {
      errorMessage = path + ": minLabelLength exceeds maxLabelLength";
      return false;
    }

    config = loaded;
    return true;

  } catch (const cv::Exception &e) {
    errorMessage = "Failed to parse configuration file " + path + ": " +
                   e.what();
    return false;
  }
}

const char *getMergeModeString(MergeMode mode) {
  switch (mode) {
  case MergeMode::SinglePass:
    return "single_pass";
  case MergeMode::FixedPoint:
    return "fixed_point";
  }
  return "unknown";
}

} // namespace regions
