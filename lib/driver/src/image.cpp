#include <driver/image.hpp>

#include <fmt/format.h>
#include <stdexcept>
#include <system_error>

#define STB_IMAGE_WRITE_STATIC
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>
#undef STB_IMAGE_WRITE_IMPLEMENTATION
#undef STB_IMAGE_WRITE_STATIC

namespace scroll_driver::driver {

image::image(int width, int height, pixel_t fill) : width_(width), height_(height)
{
  if (width < 0 or height < 0) { throw std::invalid_argument(fmt::format("invalid image size {}x{}", width, height)); }
  pixels_.assign(static_cast<std::size_t>(width) * static_cast<std::size_t>(height), fill);
}

auto image::at(int x_pos, int y_pos) const -> pixel_t
{
  if (x_pos < 0 or y_pos < 0 or x_pos >= width_ or y_pos >= height_) {
    throw std::out_of_range(fmt::format("pixel ({}, {}) outside {}x{} image", x_pos, y_pos, width_, height_));
  }
  return pixels_[static_cast<std::size_t>(y_pos) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x_pos)];
}

auto image::set(int x_pos, int y_pos, pixel_t value) -> void
{
  if (x_pos < 0 or y_pos < 0 or x_pos >= width_ or y_pos >= height_) {
    throw std::out_of_range(fmt::format("pixel ({}, {}) outside {}x{} image", x_pos, y_pos, width_, height_));
  }
  pixels_[static_cast<std::size_t>(y_pos) * static_cast<std::size_t>(width_) + static_cast<std::size_t>(x_pos)] =
    value;
}

auto image::draw(const image &source, point origin) -> void
{
  for (int src_y = 0; src_y < source.height(); ++src_y) {
    const int dst_y = origin.y + src_y;
    if (dst_y < 0 or dst_y >= height_) { continue; }
    for (int src_x = 0; src_x < source.width(); ++src_x) {
      const int dst_x = origin.x + src_x;
      if (dst_x < 0 or dst_x >= width_) { continue; }
      set(dst_x, dst_y, source.at(src_x, src_y));
    }
  }
}

namespace {

  constexpr int rgba_channels = 4;

  // stb expects tightly packed RGBA rows
  auto to_rgba(const image &img) -> std::vector<std::uint8_t>
  {
    if (img.empty()) { throw std::invalid_argument("cannot encode an empty image"); }

    constexpr unsigned alpha_shift = 24;
    constexpr unsigned red_shift = 16;
    constexpr unsigned green_shift = 8;
    constexpr pixel_t channel_mask = 0xFF;

    std::vector<std::uint8_t> rgba;
    rgba.reserve(static_cast<std::size_t>(img.width()) * static_cast<std::size_t>(img.height()) * rgba_channels);
    for (int y_pos = 0; y_pos < img.height(); ++y_pos) {
      for (int x_pos = 0; x_pos < img.width(); ++x_pos) {
        const auto pixel = img.at(x_pos, y_pos);
        rgba.push_back(static_cast<std::uint8_t>((pixel >> red_shift) & channel_mask));
        rgba.push_back(static_cast<std::uint8_t>((pixel >> green_shift) & channel_mask));
        rgba.push_back(static_cast<std::uint8_t>(pixel & channel_mask));
        rgba.push_back(static_cast<std::uint8_t>((pixel >> alpha_shift) & channel_mask));
      }
    }
    return rgba;
  }

}// namespace

auto encode_png(const image &img) -> std::vector<std::uint8_t>
{
  const auto rgba = to_rgba(img);

  int length = 0;
  unsigned char *encoded =
    stbi_write_png_to_mem(rgba.data(), img.width() * rgba_channels, img.width(), img.height(), rgba_channels, &length);
  if (encoded == nullptr) { throw std::runtime_error("png encoding failed"); }

  std::vector<std::uint8_t> png(encoded, encoded + length);
  STBIW_FREE(encoded);
  return png;
}

auto write_png(const image &img, const std::filesystem::path &path) -> void
{
  const auto rgba = to_rgba(img);

  if (path.has_parent_path()) {
    std::error_code error;
    std::filesystem::create_directories(path.parent_path(), error);
    if (error) {
      throw std::runtime_error(fmt::format("cannot create {}: {}", path.parent_path().string(), error.message()));
    }
  }

  if (stbi_write_png(
        path.string().c_str(), img.width(), img.height(), rgba_channels, rgba.data(), img.width() * rgba_channels)
      == 0) {
    throw std::runtime_error(fmt::format("failed writing {}", path.string()));
  }
}

}// namespace scroll_driver::driver
