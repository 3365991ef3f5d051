#include "PageModel.hpp"

namespace regions {

Rect boundingBoxOf(const PrimitiveShape &shape) {
  return std::visit([](const auto &s) { return s.boundingBox; }, shape);
}

Rect PageContent::pageRect() const {
  if (!Rect::isWellFormed(0.0, 0.0, width, height)) {
    return Rect();
  }
  return Rect(0.0, 0.0, width, height);
}

const char *getCandidateSourceString(CandidateSource source) {
  switch (source) {
  case CandidateSource::Vector:
    return "vector";
  case CandidateSource::Image:
    return "image";
  case CandidateSource::Detector:
    return "detector";
  }
  return "unknown";
}

} // namespace regions
