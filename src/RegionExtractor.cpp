#include "RegionExtractor.hpp"

#include "RegionFilter.hpp"
#include "RegionMerger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace regions {

namespace {

bool containsIgnoreCase(const std::string &text, const std::string &token) {
  if (token.empty()) {
    return true;
  }
  auto it = std::search(text.begin(), text.end(), token.begin(), token.end(),
                        [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                        });
  return it != text.end();
}

} // anonymous namespace

RegionExtractor::RegionExtractor() : RegionExtractor(RegionConfig()) {}

RegionExtractor::RegionExtractor(const RegionConfig &config)
    : m_config(config), m_classifier(config.classifier), m_labels(config) {}

bool RegionExtractor::isInHeaderOrFooter(const Rect &rect,
                                         double pageHeight) const {
  // Without a page height there is no band to test against
  if (pageHeight <= 0.0) {
    return false;
  }
  return rect.y0() < m_config.headerFraction * pageHeight ||
         rect.y1() > (1.0 - m_config.footerFraction) * pageHeight;
}

std::vector<CandidateRegion>
RegionExtractor::collectVectorCandidates(const PageContent &page) const {
  std::vector<CandidateRegion> candidates;

  for (const auto &drawing : page.drawings) {
    if (drawing.shapes.empty()) {
      continue;
    }

    if (!m_classifier.isPotentialDiagram(drawing.shapes)) {
      continue;
    }

    if (isInHeaderOrFooter(drawing.boundingBox, page.height)) {
      if (m_config.debug) {
        std::cerr << "DEBUG: Page " << page.pageNumber << ": drawing "
                  << drawing.boundingBox << " in header/footer band, skipped"
                  << std::endl;
      }
      continue;
    }

    CandidateRegion candidate;
    candidate.boundingBox = drawing.boundingBox;
    candidate.source = CandidateSource::Vector;
    candidates.push_back(candidate);
  }

  return candidates;
}

std::vector<CandidateRegion>
RegionExtractor::collectImageCandidates(const PageContent &page) const {
  std::vector<CandidateRegion> candidates;

  for (const auto &image : page.images) {
    const Rect &box = image.boundingBox;
    if (box.width() < m_config.minImageWidth ||
        box.height() < m_config.minImageHeight) {
      continue;
    }

    if (isInHeaderOrFooter(box, page.height)) {
      if (m_config.debug) {
        std::cerr << "DEBUG: Page " << page.pageNumber << ": image " << box
                  << " in header/footer band, skipped" << std::endl;
      }
      continue;
    }

    CandidateRegion candidate;
    candidate.boundingBox = box;
    candidate.source = CandidateSource::Image;
    candidates.push_back(candidate);
  }

  return candidates;
}

std::vector<Rect>
RegionExtractor::resolveRegions(const std::vector<CandidateRegion> &candidates,
                                const Rect &pageRect) const {
  std::vector<Rect> rects;
  rects.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    if (m_config.debug) {
      std::cerr << "DEBUG: Candidate " << candidate.boundingBox << " ("
                << getCandidateSourceString(candidate.source) << ")"
                << std::endl;
    }
    rects.push_back(candidate.boundingBox);
  }

  std::vector<Rect> merged =
      mergeRegions(rects, m_config.mergeDistance, m_config.mergeMode);

  if (m_config.debug) {
    std::cerr << "DEBUG: Merged " << rects.size() << " candidates into "
              << merged.size() << " regions ("
              << getMergeModeString(m_config.mergeMode) << ")" << std::endl;
  }

  // Malformed regions are dropped before they can take part in containment
  bool checkPageBounds = pageRect.area() > 0.0;

  std::vector<Rect> result;
  for (const auto &rect : merged) {
    if (rect.width() <= 0.0 || rect.height() <= 0.0) {
      if (m_config.debug) {
        std::cerr << "DEBUG: Skipping degenerate region " << rect << std::endl;
      }
      continue;
    }
    if (checkPageBounds && !pageRect.intersects(rect)) {
      if (m_config.debug) {
        std::cerr << "DEBUG: Skipping region outside page bounds " << rect
                  << std::endl;
      }
      continue;
    }
    result.push_back(rect);
  }

  if (m_config.removeOuterRegions) {
    result = removeOuterRegions(result);
  }
  if (m_config.minAreaRatio > 0.0) {
    result = filterBySize(result, m_config.minAreaRatio);
  }

  return result;
}

std::vector<ExtractedRegion>
RegionExtractor::extractDiagrams(const PageContent &page) const {
  std::vector<CandidateRegion> candidates = collectVectorCandidates(page);
  std::vector<CandidateRegion> imageCandidates = collectImageCandidates(page);

  if (m_config.debug) {
    std::cerr << "DEBUG: Page " << page.pageNumber << ": "
              << candidates.size() << " vector and " << imageCandidates.size()
              << " image candidates from " << page.drawings.size()
              << " drawings and " << page.images.size() << " images"
              << std::endl;
  }

  candidates.insert(candidates.end(), imageCandidates.begin(),
                    imageCandidates.end());
  if (candidates.empty()) {
    return {};
  }

  std::vector<Rect> regions = resolveRegions(candidates, page.pageRect());
  return m_labels.associateAll(regions, page.textSpans);
}

std::vector<CandidateRegion>
RegionExtractor::selectTables(const std::vector<Detection> &detections) const {
  std::vector<Detection> tables;
  for (const auto &detection : detections) {
    if (!containsIgnoreCase(detection.label, m_config.tableLabelToken)) {
      continue;
    }
    if (detection.score < m_config.minTableScore) {
      continue;
    }
    if (detection.boundingBox.area() <= 0.0) {
      if (m_config.debug) {
        std::cerr << "DEBUG: Skipping empty table box "
                  << detection.boundingBox << std::endl;
      }
      continue;
    }
    tables.push_back(detection);
  }

  std::vector<Rect> boxes;
  boxes.reserve(tables.size());
  for (const auto &table : tables) {
    boxes.push_back(table.boundingBox);
  }

  std::vector<CandidateRegion> inner;
  for (std::size_t index :
       selectInnerRegions(boxes, m_config.containmentThreshold)) {
    CandidateRegion candidate;
    candidate.boundingBox = tables[index].boundingBox;
    candidate.source = CandidateSource::Detector;
    candidate.confidence = tables[index].score;
    inner.push_back(candidate);
  }

  if (m_config.debug) {
    std::cerr << "DEBUG: Kept " << inner.size() << " inner tables of "
              << tables.size() << " table detections" << std::endl;
  }

  return inner;
}

} // namespace regions
