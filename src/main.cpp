#include "OCRTextSource.hpp"
#include "PDFPageSource.hpp"
#include "RegionConfig.hpp"
#include "RegionExtractor.hpp"
#include "RegionWriter.hpp"
#include "ScannedPageSource.hpp"
#include "TableDetector.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace {

enum class Mode { Diagrams, Tables };

struct Options {
  std::string inputPath;
  Mode mode = Mode::Diagrams;
  std::string outputDir = "regions";
  double dpi = 0; // 0 = mode default
  std::string configPath;
  std::set<int> skipPages;
  std::string language = "eng";
  bool fixedPoint = false;
  bool keepTablePages = false;
  bool verbose = false;
};

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <input.pdf|image> [options]\n"
      << "\nOptions:\n"
      << "  -m, --mode <mode>       diagrams (default) or tables\n"
      << "  -o, --output <dir>      Output directory (default: regions)\n"
      << "  -d, --dpi <val>         Render/scan resolution (default: 300 for\n"
      << "                          diagrams, 450 for tables)\n"
      << "  -c, --config <file>     YAML or JSON configuration file\n"
      << "  -s, --skip-pages <list> Comma-separated pages to skip (e.g. 1,45)\n"
      << "  -l, --language <lang>   OCR language for image input (default: "
         "eng)\n"
      << "      --fixed-point       Merge until no more regions combine\n"
      << "      --keep-table-pages  Look for diagrams on pages with tables\n"
      << "  -v, --verbose           Print debug diagnostics\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " drawing.pdf -o out -s 1,45\n"
      << "  " << programName << " drawing.pdf -m tables -d 450\n"
      << "  " << programName << " scan.png -l eng+deu\n"
      << "\nExit status: 0 on success, 1 on usage or input errors, 2 when\n"
      << "some pages failed.\n";
}

bool parsePageList(const std::string &text, std::set<int> &pages) {
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (item.empty())
      continue;
    try {
      size_t used = 0;
      int page = std::stoi(item, &used);
      if (used != item.size() || page < 1)
        return false;
      pages.insert(page);
    } catch (const std::exception &) {
      return false;
    }
  }
  return true;
}

bool isPdf(const std::string &path) {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".pdf";
}

void printRegions(int pageNumber,
                  const std::vector<regions::ExtractedRegion> &found) {
  for (size_t i = 0; i < found.size(); ++i) {
    std::cout << "  Page " << pageNumber << " region " << (i + 1) << ": "
              << found[i].boundingBox;
    if (!found[i].labels.empty()) {
      std::cout << " labels:";
      for (const auto &label : found[i].labels) {
        std::cout << " " << label.text;
      }
    }
    std::cout << "\n";
  }
}

// Diagram mode leaves pages with tables to table mode
bool skipForTables(int pageNumber, const cv::Mat &image,
                   const regions::RegionExtractor &extractor,
                   regions::TableDetector &detector) {
  if (!extractor.getConfig().skipTablePages) {
    return false;
  }
  auto tables = regions::detectInnerTables(detector, extractor, image);
  if (tables.empty()) {
    return false;
  }
  std::cout << "Skipping page " << pageNumber << " (contains "
            << tables.size() << " table(s))\n";
  return true;
}

// Returns the number of pages that failed
int processPdfDiagrams(const Options &options,
                       const regions::RegionExtractor &extractor,
                       regions::PDFPageSource &source,
                       regions::TableDetector &detector,
                       const regions::RegionWriter &writer) {
  int failures = 0;

  for (int n = 1; n <= source.pageCount(); ++n) {
    if (options.skipPages.count(n)) {
      std::cout << "Skipping page " << n << " (skip list)\n";
      continue;
    }

    std::cout << "Processing page " << n << "...\n";
    auto loaded = source.loadPage(n);
    if (!loaded.success) {
      std::cerr << "Page " << n << " failed: " << loaded.errorMessage << "\n";
      ++failures;
      continue;
    }

    auto found = extractor.extractDiagrams(loaded.page);
    if (found.empty()) {
      std::cout << "  No diagrams found.\n";
      continue;
    }

    auto rendered = source.renderPage(n, writer.getConfig().dpi);
    if (!rendered.success) {
      std::cerr << "Page " << n << " render failed: " << rendered.errorMessage
                << "\n";
      ++failures;
      continue;
    }

    if (skipForTables(n, rendered.image, extractor, detector)) {
      continue;
    }
    printRegions(n, found);

    auto written = writer.writeDiagrams(rendered.image, n, found);
    for (const auto &file : written.writtenFiles) {
      std::cout << "  Saved: " << file << "\n";
    }
    if (!written.success) {
      std::cerr << "Page " << n << ": " << written.errorMessage << "\n";
      ++failures;
    }
  }

  return failures;
}

int writeTablesOfImage(int pageNumber, const cv::Mat &image,
                       const regions::RegionExtractor &extractor,
                       regions::TableDetector &detector,
                       const regions::RegionWriter &writer) {
  auto detections = detector.detect(image);
  auto tables = extractor.selectTables(detections);

  std::cout << "  Page " << pageNumber << ": " << detections.size()
            << " detections, " << tables.size() << " inner tables\n";

  int failures = 0;
  auto written = writer.writeTables(image, pageNumber, tables);
  if (!written.success) {
    std::cerr << "Page " << pageNumber << ": " << written.errorMessage << "\n";
    ++failures;
  }

  auto overlay = writer.writeTableOverlay(image, pageNumber, tables);
  if (!overlay.success) {
    std::cerr << "Page " << pageNumber << ": " << overlay.errorMessage
              << "\n";
    ++failures;
  }

  return failures;
}

int processPdfTables(const Options &options,
                     const regions::RegionExtractor &extractor,
                     regions::PDFPageSource &source,
                     regions::TableDetector &detector,
                     const regions::RegionWriter &writer) {
  int failures = 0;

  for (int n = 1; n <= source.pageCount(); ++n) {
    if (options.skipPages.count(n)) {
      std::cout << "Skipping page " << n << " (skip list)\n";
      continue;
    }

    auto rendered = source.renderPage(n, writer.getConfig().dpi);
    if (!rendered.success) {
      std::cerr << "Page " << n << " render failed: " << rendered.errorMessage
                << "\n";
      ++failures;
      continue;
    }

    failures += writeTablesOfImage(n, rendered.image, extractor, detector,
                                   writer);
  }

  return failures;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  Options options;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    auto requireValue = [&](const std::string &name) -> const char * {
      if (i + 1 < argc) {
        return argv[++i];
      }
      std::cerr << "Error: " << name << " requires an argument\n";
      return nullptr;
    };

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-m" || arg == "--mode") {
      const char *value = requireValue("--mode");
      if (!value)
        return 1;
      std::string mode = value;
      if (mode == "diagrams") {
        options.mode = Mode::Diagrams;
      } else if (mode == "tables") {
        options.mode = Mode::Tables;
      } else {
        std::cerr << "Error: unknown mode '" << mode << "'\n";
        return 1;
      }
    } else if (arg == "-o" || arg == "--output") {
      const char *value = requireValue("--output");
      if (!value)
        return 1;
      options.outputDir = value;
    } else if (arg == "-d" || arg == "--dpi") {
      const char *value = requireValue("--dpi");
      if (!value)
        return 1;
      try {
        options.dpi = std::stod(value);
      } catch (const std::exception &) {
        options.dpi = -1;
      }
      if (options.dpi <= 0) {
        std::cerr << "Error: --dpi must be a positive number\n";
        return 1;
      }
    } else if (arg == "-c" || arg == "--config") {
      const char *value = requireValue("--config");
      if (!value)
        return 1;
      options.configPath = value;
    } else if (arg == "-s" || arg == "--skip-pages") {
      const char *value = requireValue("--skip-pages");
      if (!value)
        return 1;
      if (!parsePageList(value, options.skipPages)) {
        std::cerr << "Error: invalid page list '" << value << "'\n";
        return 1;
      }
    } else if (arg == "-l" || arg == "--language") {
      const char *value = requireValue("--language");
      if (!value)
        return 1;
      options.language = value;
    } else if (arg == "--fixed-point") {
      options.fixedPoint = true;
    } else if (arg == "--keep-table-pages") {
      options.keepTablePages = true;
    } else if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
    } else if (arg[0] != '-') {
      options.inputPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (options.inputPath.empty()) {
    std::cerr << "Error: No input path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  regions::RegionConfig config;
  if (!options.configPath.empty()) {
    std::string error;
    if (!regions::loadRegionConfig(options.configPath, config, error)) {
      std::cerr << "Failed to load configuration: " << error << "\n";
      return 1;
    }
  }
  if (options.fixedPoint) {
    config.mergeMode = regions::MergeMode::FixedPoint;
  }
  if (options.keepTablePages) {
    config.skipTablePages = false;
  }
  if (options.verbose) {
    config.debug = true;
  }

  if (options.dpi <= 0) {
    options.dpi = (options.mode == Mode::Tables) ? 450.0 : 300.0;
  }

  regions::RegionWriterConfig writerConfig;
  writerConfig.outputDir = options.outputDir;
  writerConfig.dpi = options.dpi;
  writerConfig.cropPadding = config.cropPadding;
  writerConfig.filePrefix =
      std::filesystem::path(options.inputPath).stem().string() + "_";

  regions::RegionWriter writer(writerConfig);
  std::string error;
  if (!writer.prepare(error)) {
    std::cerr << error << "\n";
    return 1;
  }

  std::cout << "=== Region Extraction ===\n"
            << "Input: " << options.inputPath << "\n"
            << "Mode: "
            << (options.mode == Mode::Tables ? "tables" : "diagrams") << "\n"
            << "DPI: " << options.dpi << "\n"
            << "Merge: " << regions::getMergeModeString(config.mergeMode)
            << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "=========================\n\n";

  regions::RegionExtractor extractor(config);
  regions::RulingTableDetector detector;
  int failures = 0;

  if (isPdf(options.inputPath)) {
    regions::PDFPageSource source;
    if (!source.open(options.inputPath)) {
      std::cerr << source.getErrorMessage() << "\n";
      return 1;
    }
    std::cout << "Pages: " << source.pageCount() << "\n";

    if (options.mode == Mode::Tables) {
      failures = processPdfTables(options, extractor, source, detector, writer);
    } else {
      failures =
          processPdfDiagrams(options, extractor, source, detector, writer);
    }
  } else {
    cv::Mat image = cv::imread(options.inputPath, cv::IMREAD_COLOR);
    if (image.empty()) {
      std::cerr << "Failed to load image: " << options.inputPath << "\n";
      return 1;
    }

    if (options.mode == Mode::Tables) {
      failures = writeTablesOfImage(1, image, extractor, detector, writer);
    } else if (skipForTables(1, image, extractor, detector)) {
      std::cout << "  Use --keep-table-pages or table mode for this image.\n";
    } else {
      regions::OCRConfig ocrConfig;
      ocrConfig.language = options.language;
      regions::OCRTextSource ocr(ocrConfig);
      if (!ocr.initialize()) {
        std::cerr << "Warning: OCR unavailable, labels will be empty\n";
      }

      regions::ScannedPageConfig scanConfig;
      scanConfig.dpi = options.dpi;
      regions::ScannedPageSource source(scanConfig,
                                        ocr.isInitialized() ? &ocr : nullptr);

      auto loaded = source.analyzePage(image, 1);
      if (!loaded.success) {
        std::cerr << "Page 1 failed: " << loaded.errorMessage << "\n";
        return 1;
      }

      auto found = extractor.extractDiagrams(loaded.page);
      if (found.empty()) {
        std::cout << "  No diagrams found.\n";
      } else {
        printRegions(1, found);
        auto written = writer.writeDiagrams(image, 1, found);
        for (const auto &file : written.writtenFiles) {
          std::cout << "  Saved: " << file << "\n";
        }
        if (!written.success) {
          std::cerr << written.errorMessage << "\n";
          ++failures;
        }
      }
    }
  }

  if (failures > 0) {
    std::cout << "\nFinished with " << failures << " failed page(s)\n";
    return 2;
  }

  std::cout << "\nDone\n";
  return 0;
}
