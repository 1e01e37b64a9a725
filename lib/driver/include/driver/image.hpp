#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace scroll_driver::driver {

struct point
{
  int x = 0;
  int y = 0;

  auto operator==(const point &) const -> bool = default;
};

/// ARGB pixel value
using pixel_t = std::uint32_t;

inline constexpr pixel_t transparent = 0x00000000;

/**
 * @brief Owning ARGB_8888 raster.
 */
class image
{
public:
  image() = default;

  /**
   * @brief Creates an image filled with a single colour.
   *
   * @throws std::invalid_argument when a dimension is negative
   */
  image(int width, int height, pixel_t fill = transparent);

  [[nodiscard]] auto width() const -> int { return width_; }
  [[nodiscard]] auto height() const -> int { return height_; }
  [[nodiscard]] auto empty() const -> bool { return width_ == 0 or height_ == 0; }

  [[nodiscard]] auto at(int x_pos, int y_pos) const -> pixel_t;
  auto set(int x_pos, int y_pos, pixel_t value) -> void;

  /**
   * @brief Copies another image onto this one; pixels falling outside are clipped.
   *
   * @param source Image to copy
   * @param origin Position of the source's top-left corner in this image
   */
  auto draw(const image &source, point origin) -> void;

  auto operator==(const image &) const -> bool = default;

private:
  int width_ = 0;
  int height_ = 0;
  std::vector<pixel_t> pixels_;
};

/**
 * @brief Encodes an image as an RGBA PNG in memory.
 *
 * @throws std::invalid_argument for an empty image
 * @throws std::runtime_error when the encoder fails
 */
[[nodiscard]] auto encode_png(const image &img) -> std::vector<std::uint8_t>;

/**
 * @brief Writes an image as an RGBA PNG file.
 *
 * @param img Image to write
 * @param path Destination file; missing parent directories are created
 * @throws std::invalid_argument for an empty image
 * @throws std::runtime_error when the file cannot be written
 */
auto write_png(const image &img, const std::filesystem::path &path) -> void;

}// namespace scroll_driver::driver
