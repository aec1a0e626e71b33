#pragma once

#include <optional>
#include <string>
#include <utility>

#include <notcurses/notcurses.h>

#include "pixel_canvas.h"

namespace plexus::render {

struct BlitterGeometry {
    ncblitter_e blitter = NCBLIT_BRAILLE;
    int scale_x = 2; // Pixels per cell, horizontally
    int scale_y = 4;
};

// "braille", "quadrant" or "half"; anything else is rejected.
std::optional<BlitterGeometry> blitter_geometry(const std::string& name);

// PixelCanvas shown on its own child plane of the standard plane. Pixel
// coordinates map onto cells through the blitter's cell geometry.
class NotcursesSurface final : public PixelCanvas {
public:
    // Throws std::runtime_error when the plane cannot be created.
    NotcursesSurface(notcurses* nc, BlitterGeometry geometry, unsigned rows, unsigned cols);
    ~NotcursesSurface() override;

    NotcursesSurface(const NotcursesSurface&) = delete;
    NotcursesSurface& operator=(const NotcursesSurface&) = delete;

    void resize(int width, int height) override;
    void resize_cells(unsigned rows, unsigned cols);

    // Moves the plane relative to the standard plane; scrolling uses this.
    void move_cells(int y, int x);
    int cell_y() const { return cell_y_; }
    int cell_x() const { return cell_x_; }

    // Pointer position of a terminal cell, in surface client coordinates.
    std::pair<double, double> cell_to_client(int y, int x) const;

    // Blits the pixel buffer onto the plane. Returns false on failure.
    bool present();

    void detach() override;

    ncplane* plane() const { return plane_; }
    const BlitterGeometry& geometry() const { return geometry_; }

private:
    void sync_origin();

    notcurses* nc_ = nullptr;
    ncplane* plane_ = nullptr;
    BlitterGeometry geometry_{};
    int cell_y_ = 0;
    int cell_x_ = 0;
};

} // namespace plexus::render
