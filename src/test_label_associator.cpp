#include "LabelAssociator.hpp"

#include <iostream>

static int failures = 0;

static void check(bool condition, const std::string &description) {
  std::cout << (condition ? "  [PASS] " : "  [FAIL] ") << description
            << std::endl;
  if (!condition)
    failures++;
}

using namespace regions;

static TextSpan span(const std::string &text, double x0, double y0, double x1,
                     double y1) {
  TextSpan s;
  s.text = text;
  s.boundingBox = Rect(x0, y0, x1, y1);
  return s;
}

int main() {
  LabelAssociator associator;
  Rect region(100, 100, 300, 300);

  std::cout << "=== Test label text rules ===" << std::endl;
  {
    check(associator.isLabelText("A1"), "two characters accepted");
    check(!associator.isLabelText("A"), "one character rejected");
    check(associator.isLabelText(std::string(20, 'X')),
          "20 characters accepted");
    check(!associator.isLabelText(std::string(21, 'X')),
          "21 characters rejected");
    check(!associator.isLabelText("Table 3"), "denylisted TABLE rejected");
    check(!associator.isLabelText("3mm thk"), "denylist is case-insensitive");
    check(!associator.isLabelText("NUCF-2"), "denylisted substring rejected");
    check(associator.isLabelText("\xC3\x84\xC3\x96"),
          "two UTF-8 characters count as two");
    check(utf8Length("\xC3\x84\xC3\x96") == 2, "utf8Length");
    check(trimText("  B7 \n") == "B7", "trimText");
  }

  std::cout << std::endl << "=== Test proximity ===" << std::endl;
  {
    auto labels = associator.associate(
        region, {span("INSIDE", 150, 150, 200, 160)});
    check(labels.size() == 1, "span centred inside the region is a label");

    // Span much larger than the region but centred on it
    labels = associator.associate(region, {span("AB", 0, 0, 400, 400)});
    check(labels.size() == 1, "large span with centre inside is a label");

    labels = associator.associate(region, {span("NEAR", 340, 150, 380, 160)});
    check(labels.size() == 1, "span 40 away is a label");

    labels = associator.associate(region, {span("FAR", 360, 150, 400, 160)});
    check(labels.empty(), "span 60 away is not a label");

    labels = associator.associate(region, {span("EDGE", 350, 150, 380, 160)});
    check(labels.empty(), "span exactly 50 away is not a label");

    labels = associator.associate(region,
                                  {span("  P1  ", 150, 150, 200, 160)});
    check(labels.size() == 1 && labels[0].text == "P1",
          "label text is trimmed");
  }

  std::cout << std::endl << "=== Test scan order ===" << std::endl;
  {
    std::vector<TextSpan> spans = {span("B2", 150, 200, 170, 210),
                                   span("NOTE 1", 150, 120, 190, 130),
                                   span("A1", 150, 120, 170, 130)};
    auto labels = associator.associate(region, spans);
    check(labels.size() == 2, "denylisted span skipped");
    check(labels.size() == 2 && labels[0].text == "B2" &&
              labels[1].text == "A1",
          "labels keep span order");
  }

  std::cout << std::endl << "=== Test exclusive binding ===" << std::endl;
  {
    // Two regions 30 apart; the span between them is near both
    Rect left(0, 0, 100, 100);
    Rect right(130, 0, 230, 100);
    std::vector<TextSpan> spans = {span("X1", 105, 40, 125, 50)};

    auto exclusive = associator.associateAll({left, right}, spans);
    check(exclusive.size() == 2, "one result per region");
    check(exclusive[0].labels.size() == 1 && exclusive[1].labels.empty(),
          "first region claims the shared label");

    RegionConfig shared;
    shared.exclusiveLabels = false;
    LabelAssociator sharing(shared);
    auto both = sharing.associateAll({left, right}, spans);
    check(both[0].labels.size() == 1 && both[1].labels.size() == 1,
          "shared binding gives the label to both regions");

    check(exclusive[1].boundingBox == right, "region bounds are kept");
  }

  std::cout << std::endl << "=== Test custom configuration ===" << std::endl;
  {
    RegionConfig config;
    config.labelDistance = 100;
    config.labelDenylist = {"REV"};
    LabelAssociator custom(config);

    check(custom.isLabelText("TABLE"), "default denylist replaced");
    check(!custom.isLabelText("rev B"), "custom denylist applied");
    check(custom.associate(region, {span("FAR", 360, 150, 400, 160)}).size() ==
              1,
          "larger label distance reaches 60 away");
  }

  std::cout << std::endl;
  if (failures > 0) {
    std::cout << failures << " check(s) failed" << std::endl;
    return 1;
  }
  std::cout << "All checks passed" << std::endl;
  return 0;
}
