#include "layout_chunker/image.h"
#include "mupdf_context.h"
#include <algorithm>
#include <stdexcept>

namespace layout_chunker {

Image::Image(int width, int height, std::vector<uint8_t> rgb)
    : width_(width), height_(height), pixels_(std::move(rgb)) {
    if (width < 0 || height < 0 ||
        pixels_.size() != static_cast<size_t>(width) * static_cast<size_t>(height) * 3) {
        throw std::invalid_argument("RGB buffer does not match image dimensions");
    }
}

const uint8_t* Image::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= width_ || y >= height_) {
        throw std::out_of_range("Pixel outside image");
    }
    return pixels_.data() + (static_cast<size_t>(y) * width_ + x) * 3;
}

Image Image::decode(const std::vector<uint8_t>& encoded) {
    MuPdfContext mupdf;
    fz_context* ctx = mupdf.get();

    fz_buffer* buf = nullptr;
    fz_image* image = nullptr;
    fz_pixmap* pix = nullptr;
    fz_pixmap* rgb = nullptr;

    fz_var(buf);
    fz_var(image);
    fz_var(pix);
    fz_var(rgb);

    Image result;

    fz_try(ctx) {
        buf = fz_new_buffer_from_copied_data(ctx, encoded.data(), encoded.size());
        image = fz_new_image_from_buffer(ctx, buf);
        pix = fz_get_pixmap_from_image(ctx, image, nullptr, nullptr, nullptr, nullptr);
        rgb = fz_convert_pixmap(ctx, pix, fz_device_rgb(ctx), nullptr, nullptr,
                                fz_default_color_params, 0);
        result = image_from_pixmap(ctx, rgb);
    }
    fz_always(ctx) {
        fz_drop_pixmap(ctx, rgb);
        fz_drop_pixmap(ctx, pix);
        fz_drop_image(ctx, image);
        fz_drop_buffer(ctx, buf);
    }
    fz_catch(ctx) {
        mupdf.rethrow("Failed to decode image");
    }

    return result;
}

Image Image::concat_vertical(const Image& top, const Image& bottom) {
    int width = std::max(top.width_, bottom.width_);
    int height = top.height_ + bottom.height_;

    std::vector<uint8_t> canvas(static_cast<size_t>(width) * height * 3, 0);

    auto paste = [&canvas, width](const Image& src, int y_offset) {
        for (int y = 0; y < src.height_; ++y) {
            auto row_begin = src.pixels_.begin() + static_cast<size_t>(y) * src.width_ * 3;
            std::copy(row_begin, row_begin + src.width_ * 3,
                      canvas.begin() + (static_cast<size_t>(y + y_offset) * width) * 3);
        }
    };

    paste(top, 0);
    paste(bottom, top.height_);

    return Image(width, height, std::move(canvas));
}

std::vector<uint8_t> Image::to_png() const {
    if (empty()) {
        return {};
    }

    MuPdfContext mupdf;
    fz_context* ctx = mupdf.get();

    // fz_new_pixmap_with_data wants mutable samples
    std::vector<uint8_t> samples(pixels_);
    std::vector<uint8_t> png;

    fz_pixmap* pix = nullptr;
    fz_buffer* buf = nullptr;
    fz_var(pix);
    fz_var(buf);

    fz_try(ctx) {
        pix = fz_new_pixmap_with_data(ctx, fz_device_rgb(ctx), width_, height_, nullptr, 0,
                                      width_ * 3, samples.data());
        buf = fz_new_buffer_from_pixmap_as_png(ctx, pix, fz_default_color_params);
        unsigned char* data = nullptr;
        size_t len = fz_buffer_storage(ctx, buf, &data);
        png.assign(data, data + len);
    }
    fz_always(ctx) {
        fz_drop_buffer(ctx, buf);
        fz_drop_pixmap(ctx, pix);
    }
    fz_catch(ctx) {
        mupdf.rethrow("Failed to encode PNG");
    }

    return png;
}

std::optional<Image> concat_images(const std::optional<Image>& first,
                                   const std::optional<Image>& second) {
    if (first && !second) return first;
    if (!first && second) return second;
    if (!first && !second) return std::nullopt;
    return Image::concat_vertical(*first, *second);
}

} // namespace layout_chunker
