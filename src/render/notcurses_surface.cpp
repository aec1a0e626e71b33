#include "notcurses_surface.h"

#include <algorithm>
#include <stdexcept>

namespace plexus::render {

std::optional<BlitterGeometry> blitter_geometry(const std::string& name) {
    if (name == "braille") {
        return BlitterGeometry{NCBLIT_BRAILLE, 2, 4};
    }
    if (name == "quadrant") {
        return BlitterGeometry{NCBLIT_2x2, 2, 2};
    }
    if (name == "half") {
        return BlitterGeometry{NCBLIT_2x1, 1, 2};
    }
    return std::nullopt;
}

NotcursesSurface::NotcursesSurface(notcurses* nc, BlitterGeometry geometry, unsigned rows, unsigned cols)
    : PixelCanvas(static_cast<int>(cols) * geometry.scale_x, static_cast<int>(rows) * geometry.scale_y),
      nc_(nc),
      geometry_(geometry) {
    if (!nc_) {
        throw std::runtime_error("notcurses context is null");
    }

    ncplane_options opts{};
    opts.rows = std::max(rows, 1u);
    opts.cols = std::max(cols, 1u);
    opts.y = 0;
    opts.x = 0;

    plane_ = ncplane_create(notcurses_stdplane(nc_), &opts);
    if (!plane_) {
        throw std::runtime_error("failed to create particle plane");
    }
    sync_origin();
}

NotcursesSurface::~NotcursesSurface() {
    if (plane_) {
        ncplane_destroy(plane_);
        plane_ = nullptr;
    }
}

void NotcursesSurface::resize(int width, int height) {
    const int cols = std::max(1, (width + geometry_.scale_x - 1) / geometry_.scale_x);
    const int rows = std::max(1, (height + geometry_.scale_y - 1) / geometry_.scale_y);
    if (plane_) {
        ncplane_resize_simple(plane_, static_cast<unsigned>(rows), static_cast<unsigned>(cols));
    }
    PixelCanvas::resize(width, height);
}

void NotcursesSurface::resize_cells(unsigned rows, unsigned cols) {
    resize(static_cast<int>(cols) * geometry_.scale_x, static_cast<int>(rows) * geometry_.scale_y);
}

void NotcursesSurface::move_cells(int y, int x) {
    if (!plane_) {
        return;
    }
    if (ncplane_move_yx(plane_, y, x) == 0) {
        sync_origin();
    }
}

std::pair<double, double> NotcursesSurface::cell_to_client(int y, int x) const {
    // Centre of the cell.
    const double client_x = (static_cast<double>(x) + 0.5) * geometry_.scale_x;
    const double client_y = (static_cast<double>(y) + 0.5) * geometry_.scale_y;
    return {client_x, client_y};
}

bool NotcursesSurface::present() {
    if (!plane_ || width() <= 0 || height() <= 0) {
        return false;
    }
    ncplane_erase(plane_);

    ncvisual_options vopts{};
    vopts.n = plane_;
    vopts.blitter = geometry_.blitter;
    vopts.leny = static_cast<unsigned>(height());
    vopts.lenx = static_cast<unsigned>(width());
    vopts.flags = NCVISUAL_OPTION_NODEGRADE;
    return ncblit_rgba(data(), static_cast<int>(stride()), &vopts) >= 0;
}

void NotcursesSurface::detach() {
    PixelCanvas::detach();
    if (plane_) {
        ncplane_destroy(plane_);
        plane_ = nullptr;
    }
}

void NotcursesSurface::sync_origin() {
    ncplane_abs_yx(plane_, &cell_y_, &cell_x_);
    set_origin(static_cast<double>(cell_x_) * geometry_.scale_x, static_cast<double>(cell_y_) * geometry_.scale_y);
}

} // namespace plexus::render
