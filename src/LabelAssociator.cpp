#include "LabelAssociator.hpp"

#include <algorithm>
#include <cctype>

namespace regions {

namespace {

std::string toUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return text;
}

} // anonymous namespace

std::string trimText(const std::string &text) {
  auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };

  auto begin = std::find_if_not(text.begin(), text.end(), isSpace);
  auto end = std::find_if_not(text.rbegin(), text.rend(), isSpace).base();
  if (begin >= end) {
    return std::string();
  }
  return std::string(begin, end);
}

std::size_t utf8Length(const std::string &text) {
  // Count every byte that is not a continuation byte (10xxxxxx)
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
      }));
}

LabelAssociator::LabelAssociator() : LabelAssociator(RegionConfig()) {}

LabelAssociator::LabelAssociator(const RegionConfig &config)
    : m_labelDistance(config.labelDistance),
      m_minLength(config.minLabelLength), m_maxLength(config.maxLabelLength),
      m_exclusive(config.exclusiveLabels) {
  for (const auto &token : config.labelDenylist) {
    if (!token.empty()) {
      m_denylist.push_back(toUpper(token));
    }
  }
}

bool LabelAssociator::isLabelText(const std::string &text) const {
  std::size_t length = utf8Length(text);
  if (text.empty() || length < m_minLength || length > m_maxLength) {
    return false;
  }

  std::string upper = toUpper(text);
  for (const auto &token : m_denylist) {
    if (upper.find(token) != std::string::npos) {
      return false;
    }
  }
  return true;
}

bool LabelAssociator::isNear(const Rect &region, const Rect &span) const {
  return region.contains(span.center()) ||
         region.distanceTo(span) < m_labelDistance;
}

std::optional<Label> LabelAssociator::toLabel(const Rect &region,
                                              const TextSpan &span) const {
  std::string text = trimText(span.text);
  if (!isLabelText(text) || !isNear(region, span.boundingBox)) {
    return std::nullopt;
  }

  Label label;
  label.text = text;
  label.boundingBox = span.boundingBox;
  return label;
}

std::vector<Label>
LabelAssociator::associate(const Rect &region,
                           const std::vector<TextSpan> &spans) const {
  std::vector<Label> labels;
  for (const auto &span : spans) {
    if (auto label = toLabel(region, span)) {
      labels.push_back(*label);
    }
  }
  return labels;
}

std::vector<ExtractedRegion>
LabelAssociator::associateAll(const std::vector<Rect> &regions,
                              const std::vector<TextSpan> &spans) const {
  std::vector<ExtractedRegion> result;
  result.reserve(regions.size());

  std::vector<bool> claimed(spans.size(), false);

  for (const auto &region : regions) {
    ExtractedRegion extracted;
    extracted.boundingBox = region;

    for (size_t i = 0; i < spans.size(); i++) {
      if (m_exclusive && claimed[i]) {
        continue;
      }

      if (auto label = toLabel(region, spans[i])) {
        extracted.labels.push_back(*label);
        claimed[i] = true;
      }
    }

    result.push_back(extracted);
  }

  return result;
}

} // namespace regions
