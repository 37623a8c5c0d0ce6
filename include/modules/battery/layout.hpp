#pragma once

#include <vector>

#include "modules/battery/metrics.hpp"
#include "util/color.hpp"
#include "util/geometry.hpp"

namespace dockapp::modules::battery {

struct Palette {
  util::Color background{0xff, 0xff, 0xff};
  util::Color shell{0xaa, 0xaa, 0xaa};
  util::Color text{0x00, 0x00, 0x00};
  util::Color charging{0xef, 0xef, 0x40};
  util::Color low{0xff, 0x80, 0x80};
  util::Color normal{0x80, 0xff, 0x80};
  double low_threshold{0.15};
};

/**
 * Battery glyph lying on its side with the terminal cap on the left. The cap is two pixels wide
 * and two pixels shorter than the body at each end. Energy drains from the cap side.
 */
struct BatteryLayout {
  util::Rect bounds;
  util::Rect cap;
  util::Rect body;
  // Horizontal span available to energy, inside the shell.
  int energy_left{0};
  int energy_right{0};
  // Shell outline, drawn over the energy.
  std::vector<util::Rect> shell;
};

BatteryLayout computeLayout(const util::Rect& bounds, int thickness);

// Rectangles to fill with energy colour for a charge fraction in [0, 1].
std::vector<util::Rect> energyRects(const BatteryLayout& layout, double fraction);

const util::Color& energyColor(const Metrics& metrics, const Palette& palette);

util::Rect intersect(const util::Rect& a, const util::Rect& b);

}  // namespace dockapp::modules::battery
