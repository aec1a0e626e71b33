#include "pixel_canvas.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace plexus::render {
namespace {

float fpart(float value) {
    return value - std::floor(value);
}

float rfpart(float value) {
    return 1.0f - fpart(value);
}

bool finite_segment(float x0, float y0, float x1, float y1) {
    return std::isfinite(x0) && std::isfinite(y0) && std::isfinite(x1) && std::isfinite(y1);
}

} // namespace

PixelCanvas::PixelCanvas(int width, int height) {
    resize(width, height);
}

void PixelCanvas::resize(int width, int height) {
    width_ = std::max(width, 0);
    height_ = std::max(height, 0);
    pixels_.assign(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 4u, 0u);
    path_.clear();
    cursor_.reset();
    clear();
}

SurfaceRect PixelCanvas::bounding_rect() const {
    return SurfaceRect{origin_left_, origin_top_, static_cast<double>(width_), static_cast<double>(height_)};
}

void PixelCanvas::set_origin(double left, double top) {
    origin_left_ = left;
    origin_top_ = top;
}

void PixelCanvas::clear() {
    if (!background_) {
        std::fill(pixels_.begin(), pixels_.end(), std::uint8_t{0});
        return;
    }
    for (std::size_t i = 0; i + 3 < pixels_.size(); i += 4) {
        pixels_[i] = background_->r;
        pixels_[i + 1] = background_->g;
        pixels_[i + 2] = background_->b;
        pixels_[i + 3] = 255u;
    }
}

void PixelCanvas::set_background(const std::optional<Rgb>& background) {
    background_ = background;
}

void PixelCanvas::set_fill_color(const Rgb& color, float alpha) {
    fill_color_ = color;
    fill_alpha_ = std::clamp(alpha, 0.0f, 1.0f);
}

void PixelCanvas::set_stroke_color(const Rgb& color, float alpha) {
    stroke_color_ = color;
    stroke_alpha_ = std::clamp(alpha, 0.0f, 1.0f);
}

void PixelCanvas::set_line_width(float width) {
    line_width_ = std::max(width, 0.0f);
}

void PixelCanvas::fill_rect(float x, float y, float width, float height) {
    if (detached_ || width <= 0.0f || height <= 0.0f) {
        return;
    }
    const float x0 = std::max(x, 0.0f);
    const float y0 = std::max(y, 0.0f);
    const float x1 = std::min(x + width, static_cast<float>(width_));
    const float y1 = std::min(y + height, static_cast<float>(height_));
    if (!(x0 < x1) || !(y0 < y1)) {
        return;
    }

    const int first_col = static_cast<int>(std::floor(x0));
    const int last_col = static_cast<int>(std::ceil(x1)) - 1;
    const int first_row = static_cast<int>(std::floor(y0));
    const int last_row = static_cast<int>(std::ceil(y1)) - 1;
    for (int row = first_row; row <= last_row; ++row) {
        const float cover_y = std::min(static_cast<float>(row + 1), y1) - std::max(static_cast<float>(row), y0);
        for (int col = first_col; col <= last_col; ++col) {
            const float cover_x = std::min(static_cast<float>(col + 1), x1) - std::max(static_cast<float>(col), x0);
            blend(col, row, fill_color_, fill_alpha_ * cover_x * cover_y);
        }
    }
}

void PixelCanvas::fill_circle(float cx, float cy, float radius) {
    if (detached_ || radius <= 0.0f || !std::isfinite(cx) || !std::isfinite(cy)) {
        return;
    }
    const int first_col = std::max(0, static_cast<int>(std::floor(cx - radius - 1.0f)));
    const int last_col = std::min(width_ - 1, static_cast<int>(std::ceil(cx + radius + 1.0f)));
    const int first_row = std::max(0, static_cast<int>(std::floor(cy - radius - 1.0f)));
    const int last_row = std::min(height_ - 1, static_cast<int>(std::ceil(cy + radius + 1.0f)));

    for (int row = first_row; row <= last_row; ++row) {
        const float dy = static_cast<float>(row) + 0.5f - cy;
        for (int col = first_col; col <= last_col; ++col) {
            const float dx = static_cast<float>(col) + 0.5f - cx;
            const float coverage = std::clamp(radius + 0.5f - std::sqrt(dx * dx + dy * dy), 0.0f, 1.0f);
            if (coverage > 0.0f) {
                blend(col, row, fill_color_, fill_alpha_ * coverage);
            }
        }
    }
}

void PixelCanvas::begin_path() {
    path_.clear();
    cursor_.reset();
}

void PixelCanvas::move_to(float x, float y) {
    cursor_ = std::make_pair(x, y);
}

void PixelCanvas::line_to(float x, float y) {
    if (cursor_) {
        path_.push_back(Segment{cursor_->first, cursor_->second, x, y});
    }
    cursor_ = std::make_pair(x, y);
}

void PixelCanvas::stroke() {
    if (detached_) {
        return;
    }
    // Sub-pixel widths fade the line instead of thinning it.
    const float alpha = stroke_alpha_ * std::min(line_width_, 1.0f);
    for (const Segment& segment : path_) {
        draw_line(segment, alpha);
    }
}

void PixelCanvas::detach() {
    detached_ = true;
    path_.clear();
    cursor_.reset();
}

PixelCanvas::Pixel PixelCanvas::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        return Pixel{};
    }
    const std::size_t index = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                               static_cast<std::size_t>(x)) *
                              4u;
    return Pixel{pixels_[index], pixels_[index + 1], pixels_[index + 2], pixels_[index + 3]};
}

void PixelCanvas::blend(int x, int y, const Rgb& color, float alpha) {
    if (x < 0 || y < 0 || x >= width_ || y >= height_ || alpha <= 0.0f) {
        return;
    }
    const std::size_t index = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                               static_cast<std::size_t>(x)) *
                              4u;
    const float src_a = std::min(alpha, 1.0f);
    const float dst_a = static_cast<float>(pixels_[index + 3]) / 255.0f;
    const float out_a = src_a + dst_a * (1.0f - src_a);
    if (out_a <= 0.0f) {
        return;
    }

    auto mix = [&](std::uint8_t src, std::uint8_t dst) {
        const float value = (static_cast<float>(src) * src_a +
                             static_cast<float>(dst) * dst_a * (1.0f - src_a)) /
                            out_a;
        return static_cast<std::uint8_t>(std::clamp(std::lround(value), 0L, 255L));
    };

    pixels_[index] = mix(color.r, pixels_[index]);
    pixels_[index + 1] = mix(color.g, pixels_[index + 1]);
    pixels_[index + 2] = mix(color.b, pixels_[index + 2]);
    pixels_[index + 3] = static_cast<std::uint8_t>(std::clamp(std::lround(out_a * 255.0f), 0L, 255L));
}

// Xiaolin Wu's anti-aliased line, clipped to the canvas along the major axis.
void PixelCanvas::draw_line(const Segment& segment, float alpha) {
    float x0 = segment.x0;
    float y0 = segment.y0;
    float x1 = segment.x1;
    float y1 = segment.y1;
    if (alpha <= 0.0f || !finite_segment(x0, y0, x1, y1)) {
        return;
    }

    const bool steep = std::abs(y1 - y0) > std::abs(x1 - x0);
    if (steep) {
        std::swap(x0, y0);
        std::swap(x1, y1);
    }
    if (x0 > x1) {
        std::swap(x0, x1);
        std::swap(y0, y1);
    }

    const float dx = x1 - x0;
    const float dy = y1 - y0;
    const float gradient = dx == 0.0f ? 1.0f : dy / dx;
    const int major_extent = steep ? height_ : width_;

    auto plot = [&](int major, int minor, float coverage) {
        if (steep) {
            blend(minor, major, stroke_color_, alpha * coverage);
        } else {
            blend(major, minor, stroke_color_, alpha * coverage);
        }
    };

    float x_end = std::round(x0);
    float y_end = y0 + gradient * (x_end - x0);
    float x_gap = rfpart(x0 + 0.5f);
    const int first_major = static_cast<int>(x_end);
    const int first_minor = static_cast<int>(std::floor(y_end));
    plot(first_major, first_minor, rfpart(y_end) * x_gap);
    plot(first_major, first_minor + 1, fpart(y_end) * x_gap);
    float inter_y = y_end + gradient;

    x_end = std::round(x1);
    y_end = y1 + gradient * (x_end - x1);
    x_gap = fpart(x1 + 0.5f);
    const int last_major = static_cast<int>(x_end);
    const int last_minor = static_cast<int>(std::floor(y_end));
    plot(last_major, last_minor, rfpart(y_end) * x_gap);
    plot(last_major, last_minor + 1, fpart(y_end) * x_gap);

    int start = first_major + 1;
    const int end = std::min(last_major - 1, major_extent);
    if (start < -1) {
        inter_y += gradient * static_cast<float>(-1 - start);
        start = -1;
    }
    for (int major = start; major <= end; ++major) {
        const int minor = static_cast<int>(std::floor(inter_y));
        plot(major, minor, rfpart(inter_y));
        plot(major, minor + 1, fpart(inter_y));
        inter_y += gradient;
    }
}

} // namespace plexus::render
