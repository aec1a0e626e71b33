#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "surface.h"

namespace plexus::testing {

// Surface that records what was drawn instead of rasterizing it.
class RecordingSurface : public Surface {
public:
    struct Stroke {
        Rgb color{};
        float alpha = 0.0f;
        std::size_t segments = 0;
    };

    RecordingSurface(int width, int height)
        : width_(width),
          height_(height) {}

    int width() const override { return width_; }
    int height() const override { return height_; }
    void resize(int width, int height) override {
        width_ = width;
        height_ = height;
    }

    SurfaceRect bounding_rect() const override { return rect_; }
    void set_rect(double left, double top) {
        rect_.left = left;
        rect_.top = top;
        rect_.width = width_;
        rect_.height = height_;
    }

    void clear() override { ++clears; }
    void set_background(const std::optional<Rgb>& value) override { background = value; }

    void set_fill_color(const Rgb& color, float alpha) override {
        fill_color = color;
        fill_alpha = alpha;
    }
    void set_stroke_color(const Rgb& color, float alpha) override {
        stroke_color = color;
        stroke_alpha = alpha;
    }
    void set_line_width(float width) override { line_width = width; }

    void fill_rect(float, float, float, float) override { ++rects; }
    void fill_circle(float, float, float) override { ++circles; }

    void begin_path() override { path_segments = 0; }
    void move_to(float, float) override {}
    void line_to(float, float) override { ++path_segments; }
    void stroke() override {
        strokes.push_back(Stroke{stroke_color, stroke_alpha, path_segments});
        segments_stroked += path_segments;
    }

    void detach() override { detached = true; }

    void reset_counters() {
        clears = 0;
        rects = 0;
        circles = 0;
        segments_stroked = 0;
        strokes.clear();
    }

    std::optional<Rgb> background{};
    Rgb fill_color{};
    float fill_alpha = 0.0f;
    Rgb stroke_color{};
    float stroke_alpha = 0.0f;
    float line_width = 0.0f;

    std::size_t clears = 0;
    std::size_t rects = 0;
    std::size_t circles = 0;
    std::size_t path_segments = 0;
    std::size_t segments_stroked = 0;
    std::vector<Stroke> strokes;
    bool detached = false;

private:
    int width_ = 0;
    int height_ = 0;
    SurfaceRect rect_{};
};

} // namespace plexus::testing
