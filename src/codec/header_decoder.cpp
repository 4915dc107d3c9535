#include "codec/header_decoder.hpp"
#include "codec/byte_order.hpp"
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <cstring>

namespace webimg {
namespace codec {

namespace {

bool contains(const Bytes& data, const char* needle, std::size_t& pos) {
  std::size_t len = std::strlen(needle);
  if (data.size() < len) {
    return false;
  }
  for (std::size_t i = 0; i + len <= data.size(); ++i) {
    if (std::memcmp(data.data() + i, needle, len) == 0) {
      pos = i;
      return true;
    }
  }
  return false;
}

Image make_image(uint32_t width, uint32_t height, ImageFormat format) {
  Image image;
  image.width = width;
  image.height = height;
  image.format = format;
  return image;
}

} // namespace

//==============================================
// DECODING
//==============================================

std::optional<Image> HeaderDecoder::decode(const Bytes& data) {
  std::optional<Image> image;

  switch (detect_format(data)) {
    case ImageFormat::PNG:  image = parse_png(data);  break;
    case ImageFormat::GIF:  image = parse_gif(data);  break;
    case ImageFormat::JPEG: image = parse_jpeg(data); break;
    case ImageFormat::WebP: image = parse_webp(data); break;
    case ImageFormat::BMP:  image = parse_bmp(data);  break;
    case ImageFormat::TIFF: image = parse_tiff(data); break;
    case ImageFormat::HEIC: image = parse_heic(data); break;
    default:
      BOOST_LOG_TRIVIAL(debug) << "Header decoder: Unrecognized image format (" << data.size() << " bytes)";
      return std::nullopt;
  }

  if (image) {
    BOOST_LOG_TRIVIAL(trace) << "Header decoder: " << format_to_string(image->format) << " "
                             << image->width << "x" << image->height;
  }
  return image;
}

std::optional<Image> HeaderDecoder::decode_incremental(const Bytes& data_so_far, bool finished) {
  (void)finished;
  return decode(data_so_far);
}


//==============================================
// CONTAINER PARSERS
//==============================================

std::optional<Image> HeaderDecoder::parse_png(const Bytes& data) {
  // 8 byte signature, then the IHDR chunk: length, type, width, height
  static const uint8_t signature[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
  if (data.size() < 24 || std::memcmp(data.data(), signature, sizeof(signature)) != 0 ||
      std::memcmp(data.data() + 12, "IHDR", 4) != 0) {
    return std::nullopt;
  }

  uint32_t width = 0;
  uint32_t height = 0;
  ByteOrder::readBigEndian(data, 16, width);
  ByteOrder::readBigEndian(data, 20, height);

  Image image = make_image(width, height, ImageFormat::PNG);
  // APNG carries an acTL chunk before the first IDAT
  std::size_t pos = 0;
  image.animated = contains(data, "acTL", pos);
  return image;
}

std::optional<Image> HeaderDecoder::parse_gif(const Bytes& data) {
  if (data.size() < 10 || (std::memcmp(data.data(), "GIF87a", 6) != 0 &&
                           std::memcmp(data.data(), "GIF89a", 6) != 0)) {
    return std::nullopt;
  }

  uint16_t width = 0;
  uint16_t height = 0;
  ByteOrder::readLittleEndian(data, 6, width);
  ByteOrder::readLittleEndian(data, 8, height);

  Image image = make_image(width, height, ImageFormat::GIF);
  std::size_t pos = 0;
  image.animated = contains(data, "NETSCAPE2.0", pos);
  return image;
}

std::optional<Image> HeaderDecoder::parse_jpeg(const Bytes& data) {
  if (data.size() < 4 || data[0] != 0xFF || data[1] != 0xD8) {
    return std::nullopt;
  }

  std::size_t pos = 2;
  while (pos + 4 <= data.size()) {
    if (data[pos] != 0xFF) {
      return std::nullopt;
    }
    uint8_t marker = data[pos + 1];

    // Fill bytes
    if (marker == 0xFF) {
      ++pos;
      continue;
    }
    // Standalone markers without a length field
    if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD9)) {
      pos += 2;
      continue;
    }

    uint16_t segment_length = 0;
    if (!ByteOrder::readBigEndian(data, pos + 2, segment_length) || segment_length < 2) {
      return std::nullopt;
    }

    // SOF0..SOF15 except DHT (C4), JPG (C8) and DAC (CC)
    bool is_sof = marker >= 0xC0 && marker <= 0xCF &&
                  marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
    if (is_sof) {
      uint16_t height = 0;
      uint16_t width = 0;
      if (!ByteOrder::readBigEndian(data, pos + 5, height) ||
          !ByteOrder::readBigEndian(data, pos + 7, width)) {
        return std::nullopt;
      }
      return make_image(width, height, ImageFormat::JPEG);
    }

    pos += 2 + segment_length;
  }
  return std::nullopt;
}

std::optional<Image> HeaderDecoder::parse_webp(const Bytes& data) {
  if (data.size() < 30) {
    return std::nullopt;
  }

  if (std::memcmp(data.data() + 12, "VP8 ", 4) == 0) {
    // Lossy: frame tag (3 bytes) and start code (9d 01 2a) precede the size
    if (data[23] != 0x9D || data[24] != 0x01 || data[25] != 0x2A) {
      return std::nullopt;
    }
    uint16_t width = 0;
    uint16_t height = 0;
    ByteOrder::readLittleEndian(data, 26, width);
    ByteOrder::readLittleEndian(data, 28, height);
    return make_image(width & 0x3FFF, height & 0x3FFF, ImageFormat::WebP);
  }

  if (std::memcmp(data.data() + 12, "VP8L", 4) == 0) {
    // Lossless: signature byte, then 14 bit width-1 and 14 bit height-1
    if (data[20] != 0x2F) {
      return std::nullopt;
    }
    uint32_t bits = 0;
    ByteOrder::readLittleEndian(data, 21, bits);
    uint32_t width = (bits & 0x3FFF) + 1;
    uint32_t height = ((bits >> 14) & 0x3FFF) + 1;
    return make_image(width, height, ImageFormat::WebP);
  }

  if (std::memcmp(data.data() + 12, "VP8X", 4) == 0) {
    // Extended: flags, 3 reserved bytes, 24 bit canvas width-1 and height-1
    uint32_t width = 0;
    uint32_t height = 0;
    ByteOrder::readLittleEndian24(data, 24, width);
    ByteOrder::readLittleEndian24(data, 27, height);
    Image image = make_image(width + 1, height + 1, ImageFormat::WebP);
    image.animated = (data[20] & 0x02) != 0;
    return image;
  }

  return std::nullopt;
}

std::optional<Image> HeaderDecoder::parse_bmp(const Bytes& data) {
  int32_t width = 0;
  int32_t height = 0;
  if (!ByteOrder::readLittleEndian(data, 18, width) || !ByteOrder::readLittleEndian(data, 22, height)) {
    return std::nullopt;
  }
  // Negative height marks a top-down bitmap
  return make_image(static_cast<uint32_t>(std::abs(width)), static_cast<uint32_t>(std::abs(height)),
                    ImageFormat::BMP);
}

std::optional<Image> HeaderDecoder::parse_tiff(const Bytes& data) {
  if (data.size() < 8) {
    return std::nullopt;
  }
  bool little = data[0] == 'I' && data[1] == 'I';
  bool big = data[0] == 'M' && data[1] == 'M';
  if (!little && !big) {
    return std::nullopt;
  }

  auto read16 = [&](std::size_t offset, uint16_t& out) {
    return little ? ByteOrder::readLittleEndian(data, offset, out) : ByteOrder::readBigEndian(data, offset, out);
  };
  auto read32 = [&](std::size_t offset, uint32_t& out) {
    return little ? ByteOrder::readLittleEndian(data, offset, out) : ByteOrder::readBigEndian(data, offset, out);
  };

  uint32_t ifd_offset = 0;
  uint16_t entry_count = 0;
  if (!read32(4, ifd_offset) || !read16(ifd_offset, entry_count)) {
    return std::nullopt;
  }

  uint32_t width = 0;
  uint32_t height = 0;
  for (uint16_t i = 0; i < entry_count; ++i) {
    std::size_t entry = ifd_offset + 2 + static_cast<std::size_t>(i) * 12;
    uint16_t tag = 0;
    uint16_t type = 0;
    if (!read16(entry, tag) || !read16(entry + 2, type)) {
      return std::nullopt;
    }

    uint32_t value = 0;
    if (type == 3) {  // SHORT
      uint16_t short_value = 0;
      if (!read16(entry + 8, short_value)) {
        return std::nullopt;
      }
      value = short_value;
    } else if (type == 4) {  // LONG
      if (!read32(entry + 8, value)) {
        return std::nullopt;
      }
    } else {
      continue;
    }

    if (tag == 256) {
      width = value;
    } else if (tag == 257) {
      height = value;
    }
  }

  if (width == 0 && height == 0) {
    return std::nullopt;
  }
  return make_image(width, height, ImageFormat::TIFF);
}

std::optional<Image> HeaderDecoder::parse_heic(const Bytes& data) {
  // Image spatial extents property: size, 'ispe', version/flags, width, height
  std::size_t pos = 0;
  if (!contains(data, "ispe", pos)) {
    return std::nullopt;
  }
  uint32_t width = 0;
  uint32_t height = 0;
  if (!ByteOrder::readBigEndian(data, pos + 8, width) || !ByteOrder::readBigEndian(data, pos + 12, height)) {
    return std::nullopt;
  }
  return make_image(width, height, ImageFormat::HEIC);
}

} // namespace codec
} // namespace webimg
