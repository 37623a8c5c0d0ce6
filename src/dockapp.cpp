#include "dockapp.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

#include <X11/Xft/Xft.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>

namespace dockapp {

struct DockApp::Resources {
  Display* display;
  int screen;
  Window window{0};
  Pixmap pixmap{0};
  GC gc{nullptr};
  XftDraw* draw{nullptr};
  XftFont* font{nullptr};
  Atom wm_delete_window{0};

  Visual* visual() const { return DefaultVisual(display, screen); }
  Colormap colormap() const { return DefaultColormap(display, screen); }

  XftColor allocColor(const util::Color& color) const {
    XRenderColor render{static_cast<unsigned short>(color.r * 257),
                        static_cast<unsigned short>(color.g * 257),
                        static_cast<unsigned short>(color.b * 257),
                        static_cast<unsigned short>(color.a * 257)};
    XftColor result;
    if (XftColorAllocValue(display, visual(), colormap(), &render, &result) == 0) {
      throw std::runtime_error("unable to allocate colour " + util::toString(color));
    }
    return result;
  }

  void freeColor(XftColor& color) const { XftColorFree(display, visual(), colormap(), &color); }
};

DockApp::DockApp(Display* display, const std::string& name, const util::Rect& geometry,
                 const std::string& font)
    : display_(display), geometry_(geometry), x_(std::make_unique<Resources>()) {
  if (geometry_.empty()) {
    throw std::invalid_argument("window geometry " + util::formatGeometry(geometry_) +
                                " is empty");
  }
  x_->display = display_;
  x_->screen = DefaultScreen(display_);
  x_->font = XftFontOpenName(display_, x_->screen, font.c_str());
  if (x_->font == nullptr) {
    throw std::runtime_error(fmt::format("unable to load font \"{}\"", font));
  }

  const auto width = static_cast<unsigned>(geometry_.width);
  const auto height = static_cast<unsigned>(geometry_.height);
  x_->window = XCreateSimpleWindow(display_, RootWindow(display_, x_->screen), geometry_.x,
                                   geometry_.y, width, height, 0,
                                   BlackPixel(display_, x_->screen),
                                   WhitePixel(display_, x_->screen));

  // Openbox docks windows that start withdrawn and name themselves as their icon window.
  XWMHints* hints = XAllocWMHints();
  hints->flags = StateHint | IconWindowHint | WindowGroupHint;
  hints->initial_state = WithdrawnState;
  hints->icon_window = x_->window;
  hints->window_group = x_->window;
  XSetWMHints(display_, x_->window, hints);
  XFree(hints);

  XClassHint* class_hint = XAllocClassHint();
  class_hint->res_name = const_cast<char*>(name.c_str());
  class_hint->res_class = const_cast<char*>("DockApp");
  XSetClassHint(display_, x_->window, class_hint);
  XFree(class_hint);
  XStoreName(display_, x_->window, name.c_str());

  x_->wm_delete_window = XInternAtom(display_, "WM_DELETE_WINDOW", False);
  XSetWMProtocols(display_, x_->window, &x_->wm_delete_window, 1);
  XSelectInput(display_, x_->window, ExposureMask | StructureNotifyMask);

  x_->pixmap =
      XCreatePixmap(display_, x_->window, width, height, DefaultDepth(display_, x_->screen));
  x_->gc = XCreateGC(display_, x_->pixmap, 0, nullptr);
  x_->draw = XftDrawCreate(display_, x_->pixmap, x_->visual(), x_->colormap());
  fill(bounds(), util::Color{0xff, 0xff, 0xff});
  spdlog::debug("{}: window 0x{:x} {}", name, x_->window, util::formatGeometry(geometry_));
}

DockApp::~DockApp() {
  if (x_->draw != nullptr) {
    XftDrawDestroy(x_->draw);
  }
  if (x_->gc != nullptr) {
    XFreeGC(display_, x_->gc);
  }
  if (x_->pixmap != 0) {
    XFreePixmap(display_, x_->pixmap);
  }
  if (x_->window != 0 && !closed_) {
    XDestroyWindow(display_, x_->window);
  }
  if (x_->font != nullptr) {
    XftFontClose(display_, x_->font);
  }
  XFlush(display_);
}

auto DockApp::bounds() const -> util::Rect { return {0, 0, geometry_.width, geometry_.height}; }

auto DockApp::fill(const util::Rect& rect, const util::Color& color) -> void {
  if (rect.empty()) {
    return;
  }
  auto xft_color = x_->allocColor(color);
  XftDrawRect(x_->draw, &xft_color, rect.x, rect.y, static_cast<unsigned>(rect.width),
              static_cast<unsigned>(rect.height));
  x_->freeColor(xft_color);
}

auto DockApp::drawText(const util::Rect& box, const std::string& text, const util::Color& color)
    -> void {
  if (box.empty() || text.empty()) {
    return;
  }
  const auto* utf8 = reinterpret_cast<const FcChar8*>(text.c_str());
  const int length = static_cast<int>(text.size());
  const auto* font = x_->font;

  XGlyphInfo extents;
  XftTextExtentsUtf8(display_, x_->font, utf8, length, &extents);
  const int x = box.x + (box.width - extents.xOff) / 2;
  const int baseline = box.y + (box.height - (font->ascent + font->descent)) / 2 + font->ascent;

  XRectangle clip{static_cast<short>(box.x), static_cast<short>(box.y),
                  static_cast<unsigned short>(box.width), static_cast<unsigned short>(box.height)};
  XftDrawSetClipRectangles(x_->draw, 0, 0, &clip, 1);
  auto xft_color = x_->allocColor(color);
  XftDrawStringUtf8(x_->draw, &xft_color, x_->font, x, baseline, utf8, length);
  x_->freeColor(xft_color);
  XftDrawSetClip(x_->draw, nullptr);
}

void DockApp::copyToWindow() {
  if (closed_) {
    return;
  }
  XCopyArea(display_, x_->pixmap, x_->window, x_->gc, 0, 0,
            static_cast<unsigned>(geometry_.width), static_cast<unsigned>(geometry_.height), 0,
            0);
}

void DockApp::flush() {
  copyToWindow();
  XFlush(display_);
}

void DockApp::map() {
  XMapWindow(display_, x_->window);
  XFlush(display_);
}

int DockApp::connectionNumber() const { return ConnectionNumber(display_); }

bool DockApp::dispatchEvents() {
  while (XPending(display_) > 0) {
    XEvent event;
    XNextEvent(display_, &event);
    switch (event.type) {
      case Expose:
        if (event.xexpose.count == 0) {
          copyToWindow();
        }
        break;
      case DestroyNotify:
        if (event.xdestroywindow.window == x_->window) {
          spdlog::info("window destroyed");
          closed_ = true;
        }
        break;
      case ClientMessage:
        if (static_cast<Atom>(event.xclient.data.l[0]) == x_->wm_delete_window && !closed_) {
          spdlog::info("window closed by the window manager");
          XDestroyWindow(display_, x_->window);
          closed_ = true;
        }
        break;
      default:
        break;
    }
  }
  XFlush(display_);
  return !closed_;
}

}  // namespace dockapp
