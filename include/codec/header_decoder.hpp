#ifndef WEBIMG_CODEC_HEADER_DECODER_HPP
#define WEBIMG_CODEC_HEADER_DECODER_HPP

#include <optional>
#include "codec/image.hpp"

namespace webimg {
namespace codec {

// Default decoder: reads dimensions from the container headers of PNG, GIF,
// JPEG, WebP, BMP, TIFF and HEIC data without decoding any pixels. Because
// only the header is needed it can report an image as soon as enough of a
// download has arrived.
class HeaderDecoder : public ImageDecoder {
public:
  std::optional<Image> decode(const Bytes& data) override;

  bool supports_incremental() const override { return true; }
  std::optional<Image> decode_incremental(const Bytes& data_so_far, bool finished) override;

private:
  static std::optional<Image> parse_png(const Bytes& data);
  static std::optional<Image> parse_gif(const Bytes& data);
  static std::optional<Image> parse_jpeg(const Bytes& data);
  static std::optional<Image> parse_webp(const Bytes& data);
  static std::optional<Image> parse_bmp(const Bytes& data);
  static std::optional<Image> parse_tiff(const Bytes& data);
  static std::optional<Image> parse_heic(const Bytes& data);
};

} // namespace codec
} // namespace webimg

#endif // WEBIMG_CODEC_HEADER_DECODER_HPP
