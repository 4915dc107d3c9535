#include "codec/image.hpp"
#include <cstring>

namespace webimg {
namespace codec {

namespace {

bool matches(const Bytes& data, std::size_t offset, const char* text) {
  std::size_t len = std::strlen(text);
  if (offset + len > data.size()) {
    return false;
  }
  return std::memcmp(data.data() + offset, text, len) == 0;
}

} // namespace

ImageFormat detect_format(const Bytes& data) {
  if (data.empty()) {
    return ImageFormat::Undefined;
  }

  switch (data[0]) {
    case 0xFF:
      return ImageFormat::JPEG;
    case 0x89:
      return ImageFormat::PNG;
    case 0x47:
      return ImageFormat::GIF;
    case 0x49:
    case 0x4D:
      return ImageFormat::TIFF;
    case 0x42:
      return matches(data, 0, "BM") ? ImageFormat::BMP : ImageFormat::Undefined;
    case 0x52:
      // RIFF....WEBP
      if (matches(data, 0, "RIFF") && matches(data, 8, "WEBP")) {
        return ImageFormat::WebP;
      }
      break;
    case 0x00:
      // ....ftypheic ....ftypheix ....ftyphevc ....ftyphevx
      if (matches(data, 4, "ftypheic") || matches(data, 4, "ftypheix") ||
          matches(data, 4, "ftyphevc") || matches(data, 4, "ftyphevx")) {
        return ImageFormat::HEIC;
      }
      break;
    default:
      break;
  }
  return ImageFormat::Undefined;
}

const char* format_extension(ImageFormat format) {
  switch (format) {
    case ImageFormat::JPEG: return "jpg";
    case ImageFormat::PNG:  return "png";
    case ImageFormat::GIF:  return "gif";
    case ImageFormat::TIFF: return "tiff";
    case ImageFormat::WebP: return "webp";
    case ImageFormat::HEIC: return "heic";
    case ImageFormat::BMP:  return "bmp";
    default:                return "";
  }
}

const char* format_to_string(ImageFormat format) {
  switch (format) {
    case ImageFormat::JPEG: return "JPEG";
    case ImageFormat::PNG:  return "PNG";
    case ImageFormat::GIF:  return "GIF";
    case ImageFormat::TIFF: return "TIFF";
    case ImageFormat::WebP: return "WebP";
    case ImageFormat::HEIC: return "HEIC";
    case ImageFormat::BMP:  return "BMP";
    default:                return "Undefined";
  }
}

} // namespace codec
} // namespace webimg
