#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "../surface.h"

namespace plexus::render {

// Software RGBA surface. Pixels are stored as straight (non-premultiplied)
// R, G, B, A bytes, row-major, which is the layout ncblit_rgba() consumes.
class PixelCanvas : public Surface {
public:
    PixelCanvas(int width, int height);

    int width() const override { return width_; }
    int height() const override { return height_; }
    void resize(int width, int height) override;

    SurfaceRect bounding_rect() const override;
    void set_origin(double left, double top);

    void clear() override;
    void set_background(const std::optional<Rgb>& background) override;

    void set_fill_color(const Rgb& color, float alpha) override;
    void set_stroke_color(const Rgb& color, float alpha) override;
    void set_line_width(float width) override;

    void fill_rect(float x, float y, float width, float height) override;
    void fill_circle(float cx, float cy, float radius) override;

    void begin_path() override;
    void move_to(float x, float y) override;
    void line_to(float x, float y) override;
    void stroke() override;

    void detach() override;
    bool detached() const { return detached_; }

    const std::uint8_t* data() const { return pixels_.data(); }
    std::size_t stride() const { return static_cast<std::size_t>(width_) * 4u; }

    struct Pixel {
        std::uint8_t r = 0u;
        std::uint8_t g = 0u;
        std::uint8_t b = 0u;
        std::uint8_t a = 0u;
    };
    Pixel pixel(int x, int y) const;

private:
    struct Segment {
        float x0 = 0.0f;
        float y0 = 0.0f;
        float x1 = 0.0f;
        float y1 = 0.0f;
    };

    void blend(int x, int y, const Rgb& color, float alpha);
    void draw_line(const Segment& segment, float alpha);

    int width_ = 0;
    int height_ = 0;
    double origin_left_ = 0.0;
    double origin_top_ = 0.0;
    std::vector<std::uint8_t> pixels_;
    std::optional<Rgb> background_{};

    Rgb fill_color_{};
    float fill_alpha_ = 1.0f;
    Rgb stroke_color_{};
    float stroke_alpha_ = 1.0f;
    float line_width_ = 1.0f;

    std::vector<Segment> path_;
    std::optional<std::pair<float, float>> cursor_{};
    bool detached_ = false;
};

} // namespace plexus::render
