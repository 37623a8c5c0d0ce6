#include "modules/battery/layout.hpp"

#include <algorithm>

namespace dockapp::modules::battery {

namespace {

constexpr int CAP_SIZE = 2;

void addIfVisible(std::vector<util::Rect>& rects, const util::Rect& rect) {
  if (!rect.empty()) {
    rects.push_back(rect);
  }
}

}  // namespace

util::Rect intersect(const util::Rect& a, const util::Rect& b) {
  const int left = std::max(a.x, b.x);
  const int top = std::max(a.y, b.y);
  const int right = std::min(a.right(), b.right());
  const int bottom = std::min(a.bottom(), b.bottom());
  if (right <= left || bottom <= top) {
    return {left, top, 0, 0};
  }
  return {left, top, right - left, bottom - top};
}

BatteryLayout computeLayout(const util::Rect& bounds, int thickness) {
  BatteryLayout layout;
  layout.bounds = bounds;
  layout.cap = {bounds.x, bounds.y + CAP_SIZE, CAP_SIZE, bounds.height - 2 * CAP_SIZE};
  layout.body = {bounds.x + CAP_SIZE, bounds.y, bounds.width - CAP_SIZE, bounds.height};

  const auto& cap = layout.cap;
  const auto& body = layout.body;
  const int t = thickness;

  // The cap's hollow reaches through the body's left wall so the two read as one shell.
  const util::Rect cap_inner{cap.x + t, cap.y + t, cap.width, cap.height - 2 * t};

  layout.energy_left = cap_inner.x;
  layout.energy_right = body.right() - t;

  auto& shell = layout.shell;
  addIfVisible(shell, {body.x, body.y, body.width, t});
  addIfVisible(shell, {body.x, body.bottom() - t, body.width, t});
  addIfVisible(shell, {body.right() - t, body.y + t, t, body.height - 2 * t});
  addIfVisible(shell, {body.x, body.y + t, t, cap_inner.y - (body.y + t)});
  addIfVisible(shell, {body.x, cap_inner.bottom(), t, body.bottom() - t - cap_inner.bottom()});
  addIfVisible(shell, {cap.x, cap.y, cap.width, t});
  addIfVisible(shell, {cap.x, cap.bottom() - t, cap.width, t});
  addIfVisible(shell, {cap.x, cap.y + t, t, cap.height - 2 * t});
  return layout;
}

std::vector<util::Rect> energyRects(const BatteryLayout& layout, double fraction) {
  fraction = std::clamp(fraction, 0.0, 1.0);
  const int span = layout.energy_right - layout.energy_left;
  const int drained = static_cast<int>((1 - fraction) * span);
  const util::Rect energy{layout.energy_left + drained, layout.bounds.y,
                          layout.energy_right - layout.energy_left - drained,
                          layout.bounds.height};
  std::vector<util::Rect> rects;
  addIfVisible(rects, intersect(energy, layout.cap));
  addIfVisible(rects, intersect(energy, layout.body));
  return rects;
}

const util::Color& energyColor(const Metrics& metrics, const Palette& palette) {
  if (metrics.state == State::Charging || metrics.state == State::PendingCharge) {
    return palette.charging;
  }
  if (metrics.fraction <= palette.low_threshold) {
    return palette.low;
  }
  return palette.normal;
}

}  // namespace dockapp::modules::battery
