#include "pyramid/tile_info.hpp"

namespace deepzoom {
namespace pyramid {

PyramidLevel PyramidLevel::from_grid(int64_t num_tiles_x, int64_t num_tiles_y, int64_t inverse_scale,
                                     int64_t empty_pels_x, int64_t empty_pels_y,
                                     int64_t tile_width, int64_t tile_height) {
  PyramidLevel level;
  level.num_tiles_x = num_tiles_x;
  level.num_tiles_y = num_tiles_y;
  level.inverse_scale = inverse_scale;
  level.empty_pels_x = empty_pels_x;
  level.empty_pels_y = empty_pels_y;
  level.width = num_tiles_x * tile_width - empty_pels_x;
  level.height = num_tiles_y * tile_height - empty_pels_y;
  return level;
}

uint64_t PyramidLevel::tile_count() const {
  if (num_tiles_x <= 0 || num_tiles_y <= 0) {
    return 0;
  }
  return static_cast<uint64_t>(num_tiles_x) * static_cast<uint64_t>(num_tiles_y);
}

std::vector<TileCoordinate> enumerate_tiles(const TileInfo& info) {
  std::vector<TileCoordinate> tiles;
  tiles.reserve(static_cast<size_t>(info.num_tiles));

  for (size_t z = 0; z < info.pyramid_levels.size(); ++z) {
    const PyramidLevel& level = info.pyramid_levels[z];
    for (int64_t x = 0; x < level.num_tiles_x; ++x) {
      for (int64_t y = 0; y < level.num_tiles_y; ++y) {
        tiles.push_back({static_cast<uint32_t>(x), static_cast<uint32_t>(y), static_cast<uint32_t>(z)});
      }
    }
  }
  return tiles;
}

} // namespace pyramid
} // namespace deepzoom
