#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace layout_chunker {

// Decoded 8-bit RGB raster, rows top to bottom, no padding
class Image {
public:
    Image() = default;
    Image(int width, int height, std::vector<uint8_t> rgb);

    // Decodes PNG/JPEG/GIF/BMP/TIFF bytes with MuPDF; throws std::runtime_error
    static Image decode(const std::vector<uint8_t>& encoded);

    // Stacks two images vertically, top-aligned, on a black canvas of
    // width max(w1, w2) and height h1 + h2
    static Image concat_vertical(const Image& top, const Image& bottom);

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    const std::vector<uint8_t>& pixels() const { return pixels_; }

    // RGB triple at (x, y)
    const uint8_t* pixel(int x, int y) const;

    std::vector<uint8_t> to_png() const;

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> pixels_;
};

// Concatenation where either side may be absent
std::optional<Image> concat_images(const std::optional<Image>& first,
                                   const std::optional<Image>& second);

} // namespace layout_chunker
