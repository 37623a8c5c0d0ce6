#pragma once

#include <memory>
#include <string>

#include "interfaces/ICanvas.hpp"
#include "util/geometry.hpp"

// Xlib's macros (Status, Bool, None...) stay out of every includer.
typedef struct _XDisplay Display;

namespace dockapp {

/**
 * An X11 window that Openbox (and other window makers honouring the WM_HINTS icon window
 * convention) swallows into its dock.
 *
 * Drawing goes to an off-screen pixmap exposed through the ICanvas interface; flush() copies it
 * to the window. Expose events are answered from the same pixmap.
 */
class DockApp : public ICanvas {
 public:
  DockApp(Display* display, const std::string& name, const util::Rect& geometry,
          const std::string& font);
  ~DockApp() override;

  DockApp(const DockApp&) = delete;
  DockApp& operator=(const DockApp&) = delete;

  auto bounds() const -> util::Rect override;
  auto fill(const util::Rect& rect, const util::Color& color) -> void override;
  auto drawText(const util::Rect& box, const std::string& text, const util::Color& color)
      -> void override;

  void flush();
  void map();

  // Handles queued X events. Returns false once the window has been closed.
  bool dispatchEvents();
  int connectionNumber() const;

 private:
  struct Resources;

  void copyToWindow();

  Display* display_;
  const util::Rect geometry_;
  std::unique_ptr<Resources> x_;
  bool closed_{false};
};

}  // namespace dockapp
