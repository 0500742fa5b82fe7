#include <gtest/gtest.h>
#include <cstring>
#include <stdexcept>
#include "test_util.h"
#include "tile_compositor.h"

TEST(Compositor, CopiesTileAtOffset) {
  rgba_buf canvas;
  canvas.resize(8, 6);
  rgba_buf tile = make_solid(3, 2, 10, 20, 30, 200);

  region r;
  r.x = 4; r.y = 3; r.w = 3; r.h = 2;
  composite_tile(canvas, tile, r);

  for (uint32_t y = 0; y < canvas.h; y++) {
    for (uint32_t x = 0; x < canvas.w; x++) {
      const uint8_t *p = canvas.at(x, y);
      const bool inside = x >= 4 && x < 7 && y >= 3 && y < 5;
      if (inside) {
        EXPECT_EQ(p[0], 10); EXPECT_EQ(p[1], 20); EXPECT_EQ(p[2], 30); EXPECT_EQ(p[3], 200);
      } else {
        EXPECT_EQ(p[3], 0) << x << "," << y;
      }
    }
  }
}

TEST(Compositor, PreservesPixelsExactly) {
  rgba_buf canvas;
  canvas.resize(10, 10);
  rgba_buf tile = make_test_image(5, 5);
  region r;
  r.x = 5; r.y = 0; r.w = 5; r.h = 5;
  composite_tile(canvas, tile, r);
  for (uint32_t y = 0; y < 5; y++) {
    EXPECT_EQ(0, memcmp(canvas.at(5, y), tile.row(y), 5 * 4));
  }
}

TEST(FitTile, PadsShortTileWithTransparency) {
  rgba_buf tile = make_solid(3, 2, 1, 2, 3, 255);
  EXPECT_TRUE(fit_tile_to_extent(tile, 4, 3));
  ASSERT_EQ(tile.w, 4u);
  ASSERT_EQ(tile.h, 3u);
  EXPECT_EQ(tile.at(2, 1)[3], 255);
  EXPECT_EQ(tile.at(3, 0)[3], 0);
  EXPECT_EQ(tile.at(0, 2)[3], 0);
}

TEST(FitTile, CropsOversizedTileToTopLeft) {
  rgba_buf tile = make_test_image(6, 6);
  const rgba_buf orig = tile;
  EXPECT_TRUE(fit_tile_to_extent(tile, 4, 2));
  ASSERT_EQ(tile.w, 4u);
  ASSERT_EQ(tile.h, 2u);
  EXPECT_EQ(0, memcmp(tile.row(1), orig.row(1), 4 * 4));
}

TEST(FitTile, ExactExtentUnchanged) {
  rgba_buf tile = make_test_image(4, 4);
  const rgba_buf orig = tile;
  EXPECT_FALSE(fit_tile_to_extent(tile, 4, 4));
  EXPECT_EQ(tile.px, orig.px);
}

TEST(FitTile, ImpossibleExtentThrows) {
  rgba_buf tile = make_solid(3, 3, 1, 2, 3, 255);
  EXPECT_THROW(fit_tile_to_extent(tile, 2147483648u, 2147483648u), std::length_error);
}

TEST(Compositor, InconsistentCanvasIsLeftAlone) {
  rgba_buf canvas;
  canvas.w = 2147483648u;  // dimensions without storage
  canvas.h = 2147483648u;
  rgba_buf tile = make_solid(4, 4, 9, 9, 9, 255);
  region r;
  r.x = 0; r.y = 0; r.w = 4; r.h = 4;
  composite_tile(canvas, tile, r);
  EXPECT_TRUE(canvas.px.empty());
}
