#pragma once

#include <optional>
#include <string>

#include "color.h"

namespace plexus {

struct SurfaceRect {
    double left = 0.0;
    double top = 0.0;
    double width = 0.0;
    double height = 0.0;
};

// 2D drawing target used by the particle renderer. Coordinates are in surface
// pixels with the origin at the top-left corner.
class Surface {
public:
    virtual ~Surface() = default;

    virtual int width() const = 0;
    virtual int height() const = 0;
    virtual void resize(int width, int height) = 0;

    // Position of the surface relative to the viewport, in the same units as
    // pointer client coordinates.
    virtual SurfaceRect bounding_rect() const = 0;

    // Resets every pixel to the background (or to transparent without one).
    virtual void clear() = 0;
    virtual void set_background(const std::optional<Rgb>& background) = 0;

    virtual void set_fill_color(const Rgb& color, float alpha) = 0;
    virtual void set_stroke_color(const Rgb& color, float alpha) = 0;
    virtual void set_line_width(float width) = 0;

    virtual void fill_rect(float x, float y, float width, float height) = 0;
    virtual void fill_circle(float cx, float cy, float radius) = 0;

    virtual void begin_path() = 0;
    virtual void move_to(float x, float y) = 0;
    virtual void line_to(float x, float y) = 0;
    virtual void stroke() = 0;

    // Removes the surface from whatever displays it. Drawing afterwards is a no-op.
    virtual void detach() = 0;
};

} // namespace plexus
