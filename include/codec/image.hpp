#ifndef WEBIMG_CODEC_IMAGE_HPP
#define WEBIMG_CODEC_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "utils/bytes.hpp"

namespace webimg {
namespace codec {

enum class ImageFormat {
  Undefined = 0,
  JPEG,
  PNG,
  GIF,
  TIFF,
  WebP,
  HEIC,
  BMP
};

// Decoded dimensions of an image. Pixel data stays with the decoder.
struct Image {
  std::uint32_t width{0};
  std::uint32_t height{0};
  double scale{1.0};
  ImageFormat format{ImageFormat::Undefined};
  bool animated{false};

  bool empty() const { return width == 0 || height == 0; }

  // Approximate in-memory footprint, in pixels
  std::size_t cost() const {
    return static_cast<std::size_t>(width * scale * height * scale);
  }
};

// Sniffs the format from the leading bytes
ImageFormat detect_format(const Bytes& data);

// Lowercase file extension for a format, empty for Undefined
const char* format_extension(ImageFormat format);

const char* format_to_string(ImageFormat format);


// Decode collaborator. The core only ever looks at dimensions.
class ImageDecoder {
public:
  virtual ~ImageDecoder() = default;

  // Full decode, nullopt if the bytes are not an image this decoder understands
  virtual std::optional<Image> decode(const Bytes& data) = 0;

  // Incremental decode of a partial download
  virtual bool supports_incremental() const { return false; }
  virtual std::optional<Image> decode_incremental(const Bytes& data_so_far, bool finished) {
    (void)data_so_far;
    (void)finished;
    return std::nullopt;
  }

  // Re-encodes an image, empty if the format is not supported
  virtual Bytes encode(const Image& image, ImageFormat format) {
    (void)image;
    (void)format;
    return {};
  }
};

} // namespace codec
} // namespace webimg

#endif // WEBIMG_CODEC_IMAGE_HPP
