#include "rangeshift/pipeline/tile_grid.hpp"
#include "rangeshift/core/errors.hpp"

#include <algorithm>

namespace rangeshift::pipeline {

TileGrid build_tile_grid(int image_width, int image_height, int tile_size) {
    if (image_width <= 0 || image_height <= 0) {
        throw ShapeError("cannot tile an empty image");
    }
    if (tile_size < 1) {
        throw ValidationError("tile size must be >= 1");
    }

    TileGrid grid;
    grid.tile_size = tile_size;
    grid.rows = (image_height + tile_size - 1) / tile_size;
    grid.cols = (image_width + tile_size - 1) / tile_size;
    grid.tiles.reserve(static_cast<size_t>(grid.rows) * static_cast<size_t>(grid.cols));

    for (int r = 0; r < grid.rows; ++r) {
        const int y = r * tile_size;
        const int h = std::min(tile_size, image_height - y);
        for (int c = 0; c < grid.cols; ++c) {
            const int x = c * tile_size;
            const int w = std::min(tile_size, image_width - x);
            grid.tiles.push_back(Tile{x, y, w, h, r, c});
        }
    }
    return grid;
}

} // namespace rangeshift::pipeline
