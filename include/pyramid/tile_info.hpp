#ifndef DEEPZOOM_TILE_INFO_HPP
#define DEEPZOOM_TILE_INFO_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace deepzoom {
namespace pyramid {

// One zoom resolution of the deep-zoom pyramid
struct PyramidLevel {
  int64_t num_tiles_x{0};
  int64_t num_tiles_y{0};
  int64_t inverse_scale{0};
  int64_t empty_pels_x{0};
  int64_t empty_pels_y{0};
  int64_t width{0};    // num_tiles_x * tile_width - empty_pels_x
  int64_t height{0};   // num_tiles_y * tile_height - empty_pels_y

  // Builds a level with its pixel size derived from the tile grid
  static PyramidLevel from_grid(int64_t num_tiles_x, int64_t num_tiles_y, int64_t inverse_scale,
                                int64_t empty_pels_x, int64_t empty_pels_y,
                                int64_t tile_width, int64_t tile_height);

  uint64_t tile_count() const;
};

struct TileInfo {
  int64_t width{0};
  int64_t height{0};
  int64_t tile_size{0};
  uint64_t num_tiles{0};
  int64_t max_zoom_level{0};
  std::string origin;
  int64_t full_pyramid_depth{0};
  int64_t timestamp{0};
  std::string tiler_version_number;
  // Coarsest first, the last entry is full resolution
  std::vector<PyramidLevel> pyramid_levels;
};

struct TileCoordinate {
  uint32_t x{0};
  uint32_t y{0};
  uint32_t z{0};

  bool operator==(const TileCoordinate& other) const {
    return x == other.x && y == other.y && z == other.z;
  }
};

// Every tile of every level: z ascending, then x, then y
std::vector<TileCoordinate> enumerate_tiles(const TileInfo& info);

} // namespace pyramid
} // namespace deepzoom

#endif // DEEPZOOM_TILE_INFO_HPP
