// D2.1 — TrendLineTool: derived values, hit testing, labels, extension

#include "TestSurface.hpp"
#include "cs/render/DashPattern.hpp"
#include "cs/tools/TrendLineTool.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <memory>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static cs::Drawing makeLine(const cs::TrendLineTool& tool, cs::DomainPoint a,
                            cs::DomainPoint b, std::shared_ptr<const cs::DrawingStyle> style = nullptr) {
  cs::Drawing d = tool.createDrawing(a, std::move(style), 1000);
  d.id = 1;
  tool.finalizeDrawingData(d, cs::DomainSample::of(b));
  return d;
}

int main() {
  cs::TrendLineTool tool;
  cstest::IdentityMapper mapper;

  // ---- Test 1: creation places every anchor at the start ----
  {
    cs::Drawing d = tool.createDrawing({10, 100.004}, nullptr, 42);
    requireTrue(d.kind == cs::DrawingKind::TrendLine, "kind");
    requireTrue(d.anchors.size() == 2, "two anchors");
    requireTrue(d.start() == d.end(), "anchors coincide");
    requireTrue(near(d.start().price, 100.0), "start price snapped to 2 decimals");
    requireTrue(d.createdAt == 42, "createdAt");
    requireTrue(d.style == tool.defaultStyle(), "default style shared");
    std::printf("  Test 1 (create): PASS\n");
  }

  // ---- Test 2: derived values ----
  {
    cs::Drawing d = makeLine(tool, {0, 100}, {100, 150});
    requireTrue(near(d.derived.priceDelta, 50), "priceDelta");
    requireTrue(near(d.derived.timeDelta, 100), "timeDelta");
    requireTrue(near(d.derived.percentChange, 50), "percentChange");
    requireTrue(d.derived.hasPercentChange, "has percent");
    requireTrue(near(d.derived.slope, 0.5), "slope");
    requireTrue(near(d.derived.priceRange, 50), "priceRange");
    requireTrue(near(d.derived.length, std::sqrt(100.0 * 100.0 + 50.0 * 50.0)), "length");
    requireTrue(near(d.derived.angle, std::atan2(50.0, 100.0)), "angle");

    cs::Drawing vertical = makeLine(tool, {5, 10}, {5, 20});
    requireTrue(vertical.derived.slope == 0.0, "vertical slope is 0");

    cs::Drawing fromZero = makeLine(tool, {0, 0}, {100, 10});
    requireTrue(!fromZero.derived.hasPercentChange, "zero start price: no percent");
    std::printf("  Test 2 (derived): PASS\n");
  }

  // ---- Test 3: hit testing within tolerance ----
  {
    cs::Drawing d = makeLine(tool, {0, 0}, {100, 0});
    requireTrue(tool.hitTest(d, {50, 2}, 5, mapper, 800), "2px away hits");
    requireTrue(!tool.hitTest(d, {50, 10}, 5, mapper, 800), "10px away misses");
    requireTrue(!tool.hitTest(d, {110, 0}, 5, mapper, 800), "beyond the end misses");

    mapper.hi = 50;
    requireTrue(!tool.hitTest(d, {10, 0}, 5, mapper, 800), "unresolved anchor never hits");
    mapper.hi = 1.0e9;
    std::printf("  Test 3 (hitTest): PASS\n");
  }

  // ---- Test 4: decorations and change label ----
  {
    cs::Drawing d = makeLine(tool, {0, 100}, {100, 150});
    cs::OverlayFrame f(800, 600);
    tool.render(f, d, mapper);
    requireTrue(f.segments().size() == 1, "one stroke");
    requireTrue(f.markers().size() == 2, "two endpoint markers");
    requireTrue(near(f.markers()[0].radius, 4.0), "marker radius = width + 2");
    requireTrue(f.labels().size() == 1, "one label");
    requireTrue(f.labels()[0].text == "+50.00 (+50.00%)", "change label text");
    requireTrue(f.labels()[0].style.anchor == cs::LabelAnchor::Center, "label centred");
    requireTrue(near(f.labels()[0].at.x, 50) && near(f.labels()[0].at.y, 125), "label at midpoint");

    cs::Drawing fromZero = makeLine(tool, {0, 0}, {100, 10});
    cs::OverlayFrame z(800, 600);
    tool.render(z, fromZero, mapper);
    requireTrue(z.labels().empty(), "no label when start price is zero");
    requireTrue(z.markers().size() == 2, "markers still drawn");

    cs::Drawing small = makeLine(tool, {0, 0}, {30, 0});
    cs::OverlayFrame s(800, 600);
    tool.render(s, small, mapper);
    requireTrue(s.segments().size() == 1 && s.markers().empty() && s.labels().empty(),
                "short line: stroke only");

    cs::DrawingStyle quiet = *tool.defaultStyle();
    quiet.showLabels = false;
    cs::Drawing unlabeled = makeLine(tool, {0, 100}, {100, 150},
                                     std::make_shared<const cs::DrawingStyle>(quiet));
    cs::OverlayFrame u(800, 600);
    tool.render(u, unlabeled, mapper);
    requireTrue(u.labels().empty() && u.markers().size() == 2, "showLabels off");
    std::printf("  Test 4 (decorations): PASS\n");
  }

  // ---- Test 5: extension past either end ----
  {
    cs::DrawingStyle st = *tool.defaultStyle();
    st.extendRight = true;
    cs::Drawing d = makeLine(tool, {0, 0}, {100, 0},
                             std::make_shared<const cs::DrawingStyle>(st));
    cs::OverlayFrame f(800, 600);
    tool.render(f, d, mapper);
    requireTrue(near(f.segments()[0].a.x, 0), "start not extended");
    requireTrue(near(f.segments()[0].b.x, 1100), "end extended by max(extendPx, diagonal)");
    requireTrue(tool.hitTest(d, {600, 1}, 5, mapper, 800), "extension is hittable");

    st.extendRight = false;
    st.extendLeft = true;
    cs::Drawing left = makeLine(tool, {0, 0}, {100, 0},
                                std::make_shared<const cs::DrawingStyle>(st));
    requireTrue(tool.hitTest(left, {-500, 0}, 5, mapper, 800), "left extension hittable");
    requireTrue(!tool.hitTest(left, {600, 0}, 5, mapper, 800), "right side not extended");
    std::printf("  Test 5 (extension): PASS\n");
  }

  // ---- Test 6: unresolved anchors are skipped ----
  {
    cs::Drawing d = makeLine(tool, {0, 0}, {100, 0});
    mapper.hi = 50;
    cs::OverlayFrame f(800, 600);
    tool.render(f, d, mapper);
    requireTrue(f.segments().empty(), "nothing drawn");
    requireTrue(f.skipped() == 1, "skip recorded");
    mapper.hi = 1.0e9;
    std::printf("  Test 6 (unresolved): PASS\n");
  }

  // ---- Test 7: partial samples and idempotent finalize ----
  {
    cs::Drawing d = tool.createDrawing({0, 10}, nullptr, 0);
    cs::DomainSample partial;
    partial.point = {50, 99};
    partial.hasTime = true;
    tool.updateDrawingData(d, partial);
    requireTrue(near(d.end().time, 50) && near(d.end().price, 10), "price kept when unresolved");

    cs::DomainSample end = cs::DomainSample::of({80, 20});
    tool.finalizeDrawingData(d, end);
    cs::Drawing once = d;
    tool.finalizeDrawingData(d, end);
    requireTrue(d.anchors == once.anchors, "anchors stable");
    requireTrue(d.derived == once.derived, "derived stable");
    std::printf("  Test 7 (finalize): PASS\n");
  }

  // ---- Test 8: dash splitting ----
  {
    auto solid = cs::splitDashed({0, 0}, {100, 0}, cs::LineDash::Solid, 1.0f);
    requireTrue(solid.size() == 1, "solid is one piece");
    auto dashed = cs::splitDashed({0, 0}, {24, 0}, cs::LineDash::Dashed, 1.0f);
    requireTrue(dashed.size() == 2, "24px dashed -> 2 pieces");
    requireTrue(near(dashed[0].b.x, 8) && near(dashed[1].a.x, 12), "8 on, 4 off");
    auto wide = cs::dashLengthsOf(cs::LineDash::Dotted, 2.0f);
    requireTrue(near(wide.on, 4) && near(wide.off, 6), "dots scale with width");
    std::printf("  Test 8 (dash): PASS\n");
  }

  std::printf("D2.1 trendline_tool: ALL PASS\n");
  return 0;
}
