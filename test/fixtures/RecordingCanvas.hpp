#pragma once

#include <string>
#include <vector>

#include "interfaces/ICanvas.hpp"

// Canvas that remembers every drawing call instead of rendering it.
class RecordingCanvas : public dockapp::ICanvas {
 public:
  struct Fill {
    dockapp::util::Rect rect;
    dockapp::util::Color color;
  };
  struct Text {
    dockapp::util::Rect box;
    std::string text;
    dockapp::util::Color color;
  };

  explicit RecordingCanvas(dockapp::util::Rect bounds) : bounds_(bounds) {}

  auto bounds() const -> dockapp::util::Rect override { return bounds_; }

  auto fill(const dockapp::util::Rect& rect, const dockapp::util::Color& color) -> void override {
    fills.push_back({rect, color});
  }

  auto drawText(const dockapp::util::Rect& box, const std::string& text,
                const dockapp::util::Color& color) -> void override {
    texts.push_back({box, text, color});
  }

  std::vector<Fill> fills;
  std::vector<Text> texts;

 private:
  dockapp::util::Rect bounds_;
};
