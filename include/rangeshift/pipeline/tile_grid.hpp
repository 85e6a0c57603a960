#pragma once

#include "rangeshift/core/types.hpp"

namespace rangeshift::pipeline {

// Non-overlapping tiles of `tile_size` covering the image, row-major.
// Tiles in the last row and column are truncated at the image edge.
TileGrid build_tile_grid(int image_width, int image_height, int tile_size);

// Window of a full-grid raster under `t`. An empty input yields an empty
// output, which keeps "no layer" meaning "no layer" per tile.
template <typename MatrixT>
MatrixT extract_window(const MatrixT& full, const Tile& t) {
    if (full.size() == 0) return MatrixT();
    return full.block(t.y, t.x, t.height, t.width);
}

// Writes `part` into `full` at the tile offset.
template <typename MatrixT>
void paste_window(MatrixT& full, const MatrixT& part, const Tile& t) {
    full.block(t.y, t.x, t.height, t.width) = part;
}

} // namespace rangeshift::pipeline
