#include "RegionConfig.hpp"

#include <opencv2/core.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition)
    failures++;
}

using namespace regions;

static std::string tempPath(const std::string &name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

int main() {
  std::cout << "=== Test defaults ===" << std::endl;
  {
    RegionConfig config;
    check(config.mergeDistance == 40.0, "merge distance 40");
    check(config.mergeMode == MergeMode::SinglePass, "single pass merge");
    check(config.headerFraction == 0.10 && config.footerFraction == 0.15,
          "header 10%, footer 15%");
    check(config.labelDistance == 50.0, "label distance 50");
    check(config.labelDenylist.size() == 7, "seven denylist tokens");
    check(config.minTableScore == 0.23, "table score 0.23");
    check(config.skipTablePages, "pages with tables skipped by default");
    check(std::string(getMergeModeString(MergeMode::FixedPoint)) ==
              "fixed_point",
          "merge mode name");
  }

  std::cout << std::endl << "=== Test YAML overlay ===" << std::endl;
  {
    std::string path = tempPath("regions_test_config.yml");
    {
      cv::FileStorage fs(path, cv::FileStorage::WRITE);
      fs << "headerFraction" << 0.2;
      fs << "mergeDistance" << 25;
      fs << "mergeMode" << "fixed_point";
      fs << "exclusiveLabels" << 0;
      fs << "labelDenylist" << "[" << "REV" << "SHEET" << "]";
      fs << "classifier" << "{" << "minCurves" << 4 << "minPrimitives" << 8
         << "}";
      fs.release();
    }

    RegionConfig config;
    std::string error;
    bool ok = loadRegionConfig(path, config, error);
    check(ok, "file loads");
    if (!ok)
      std::cout << "    " << error << std::endl;

    check(config.headerFraction == 0.2, "headerFraction overridden");
    check(config.mergeDistance == 25.0, "integer accepted for a real value");
    check(config.mergeMode == MergeMode::FixedPoint, "merge mode parsed");
    check(!config.exclusiveLabels, "flag parsed from 0");
    check(config.labelDenylist.size() == 2 &&
              config.labelDenylist[1] == "SHEET",
          "denylist replaced");
    check(config.classifier.minCurves == 4 &&
              config.classifier.minPrimitives == 8,
          "classifier thresholds parsed");
    check(config.classifier.bannerMinLines == 20, "absent keys keep defaults");
    check(config.footerFraction == 0.15, "absent fraction keeps default");

    std::filesystem::remove(path);
  }

  std::cout << std::endl << "=== Test JSON overlay ===" << std::endl;
  {
    std::string path = tempPath("regions_test_config.json");
    {
      std::ofstream out(path);
      out << "{\n"
          << "  \"labelDistance\": 80.5,\n"
          << "  \"tableLabelToken\": \"grid\",\n"
          << "  \"cropPadding\": 4,\n"
          << "  \"skipTablePages\": 0\n"
          << "}\n";
    }

    RegionConfig config;
    std::string error;
    check(loadRegionConfig(path, config, error), "JSON file loads");
    check(config.labelDistance == 80.5, "labelDistance parsed");
    check(config.tableLabelToken == "grid", "tableLabelToken parsed");
    check(config.cropPadding == 4, "cropPadding parsed");
    check(!config.skipTablePages, "skipTablePages parsed");

    std::filesystem::remove(path);
  }

  std::cout << std::endl << "=== Test invalid files ===" << std::endl;
  {
    RegionConfig config;
    std::string error;
    check(!loadRegionConfig(tempPath("regions_missing_config.yml"), config,
                            error),
          "missing file fails");
    check(!error.empty(), "error message set");

    std::string path = tempPath("regions_bad_config.yml");
    {
      cv::FileStorage fs(path, cv::FileStorage::WRITE);
      fs << "mergeDistance" << 10;
      fs << "footerFraction" << 1.5;
      fs.release();
    }
    error.clear();
    check(!loadRegionConfig(path, config, error), "fraction above 1 fails");
    check(config.mergeDistance == 40.0,
          "failed load leaves the configuration untouched");

    {
      cv::FileStorage fs(path, cv::FileStorage::WRITE);
      fs << "minLabelLength" << 10;
      fs << "maxLabelLength" << 5;
      fs.release();
    }
    check(!loadRegionConfig(path, config, error),
          "min label length above max fails");

    {
      cv::FileStorage fs(path, cv::FileStorage::WRITE);
      fs << "mergeMode" << "sometimes";
      fs.release();
    }
    check(!loadRegionConfig(path, config, error), "unknown merge mode fails");

    {
      cv::FileStorage fs(path, cv::FileStorage::WRITE);
      fs << "cropPadding" << "wide";
      fs.release();
    }
    check(!loadRegionConfig(path, config, error),
          "string for an integer fails");

    std::filesystem::remove(path);
  }

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
