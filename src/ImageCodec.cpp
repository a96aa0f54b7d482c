#include "ImageCodec.hpp"
#include "Logger.hpp"

#include <csetjmp>
#include <cstdio>
#include <cstring>

// jpeglib.h needs <cstdio> first
#include <jpeglib.h>
#include <png.h>
#include <webp/encode.h>

#include <new>
#include <vector>

namespace {

unsigned Be16(const unsigned char* p) {
  return (unsigned{p[0]} << 8) | p[1];
}

unsigned Be32(const unsigned char* p) {
  return (unsigned{p[0]} << 24) | (unsigned{p[1]} << 16) |
         (unsigned{p[2]} << 8) | p[3];
}

unsigned Le16(const unsigned char* p) {
  return unsigned{p[0]} | (unsigned{p[1]} << 8);
}

unsigned Le24(const unsigned char* p) {
  return unsigned{p[0]} | (unsigned{p[1]} << 8) | (unsigned{p[2]} << 16);
}

std::optional<ImageInfo> SniffJpeg(const unsigned char* d, size_t n) {
  size_t i = 2;
  while (i + 9 < n) {
    if (d[i] != 0xFF)
      return std::nullopt;
    unsigned char marker = d[i + 1];
    if (marker == 0xFF) {  // fill byte
      ++i;
      continue;
    }
    if (marker == 0xD8 || marker == 0x01 || (marker >= 0xD0 && marker <= 0xD7)) {
      i += 2;
      continue;
    }
    if (marker == 0xD9 || marker == 0xDA)  // EOI / start of scan
      return std::nullopt;
    const bool sof = marker >= 0xC0 && marker <= 0xCF && marker != 0xC4 &&
                     marker != 0xC8 && marker != 0xCC;
    if (sof) {
      ImageInfo info{"jpeg", static_cast<int>(Be16(d + i + 7)),
                     static_cast<int>(Be16(d + i + 5))};
      return info;
    }
    i += 2 + Be16(d + i + 2);
  }
  return std::nullopt;
}

std::optional<ImageInfo> SniffWebp(const unsigned char* d, size_t n) {
  if (n < 30)
    return std::nullopt;
  if (std::memcmp(d + 12, "VP8 ", 4) == 0) {
    return ImageInfo{"webp", static_cast<int>(Le16(d + 26) & 0x3FFF),
                     static_cast<int>(Le16(d + 28) & 0x3FFF)};
  }
  if (std::memcmp(d + 12, "VP8L", 4) == 0) {
    const unsigned char* b = d + 21;
    int w = 1 + static_cast<int>(((b[1] & 0x3Fu) << 8) | b[0]);
    int h = 1 + static_cast<int>(((b[3] & 0xFu) << 10) | (unsigned{b[2]} << 2) |
                                 ((b[1] & 0xC0u) >> 6));
    return ImageInfo{"webp", w, h};
  }
  if (std::memcmp(d + 12, "VP8X", 4) == 0) {
    return ImageInfo{"webp", 1 + static_cast<int>(Le24(d + 24)),
                     1 + static_cast<int>(Le24(d + 27))};
  }
  return std::nullopt;
}

// Decoded PNG, normalized to at most 8 bits per channel.
struct PngImage {
  png_uint_32 width{0};
  png_uint_32 height{0};
  int bit_depth{0};
  int color_type{0};
  size_t rowbytes{0};
  std::vector<unsigned char> pixels;
  std::vector<png_bytep> row_ptrs;
  std::vector<png_color> palette;
  std::vector<png_byte> trns;  // palette alpha
  bool has_trns_color{false};
  png_color_16 trns_color{};
  bool stripped_16{false};
};

struct ReadCursor {
  const unsigned char* data;
  size_t size;
  size_t pos;
};

void ReadFromMemory(png_structp png, png_bytep out, png_size_t len) {
  auto* cur = static_cast<ReadCursor*>(png_get_io_ptr(png));
  if (cur->pos + len > cur->size) {
    png_error(png, "truncated PNG data");
  }
  std::memcpy(out, cur->data + cur->pos, len);
  cur->pos += len;
}

void WriteToMemory(png_structp png, png_bytep data, png_size_t len) {
  auto* out = static_cast<std::string*>(png_get_io_ptr(png));
  out->append(reinterpret_cast<const char*>(data), len);
}

void FlushMemory(png_structp) {
}

void SilentWarning(png_structp, png_const_charp msg) {
  logr::debug << "[ImageCodec] libpng: " << msg;
}

bool WithinBudget(png_uint_32 width, png_uint_32 height, std::string* error) {
  if (std::uint64_t{width} * height <= kMaxImagePixels)
    return true;
  *error = "image too large: " + std::to_string(width) + "x" +
           std::to_string(height);
  return false;
}

// setjmp frames below hold only trivially destructible locals; all owning
// state lives in the caller's objects.
// With `rgba` set the pixels are expanded to 8-bit RGBA for WebP encoding;
// otherwise the PNG layout is kept for re-encoding.
bool DecodePng(const std::string& bytes, PngImage* img, std::string* error,
               bool rgba = false) {
  ReadCursor cursor{reinterpret_cast<const unsigned char*>(bytes.data()),
                    bytes.size(), 0};
  png_structp png =
    png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr,
                           SilentWarning);
  if (png == nullptr) {
    *error = "png_create_read_struct failed";
    return false;
  }
  png_infop info = png_create_info_struct(png);
  if (info == nullptr) {
    png_destroy_read_struct(&png, nullptr, nullptr);
    *error = "png_create_info_struct failed";
    return false;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_read_struct(&png, &info, nullptr);
    *error = "corrupt PNG";
    return false;
  }

  png_set_read_fn(png, &cursor, ReadFromMemory);
  png_read_info(png, info);

  img->width = png_get_image_width(png, info);
  img->height = png_get_image_height(png, info);
  img->bit_depth = png_get_bit_depth(png, info);
  img->color_type = png_get_color_type(png, info);
  if (!WithinBudget(img->width, img->height, error)) {
    png_destroy_read_struct(&png, &info, nullptr);
    return false;
  }

  if (rgba) {
    png_set_expand(png);
    png_set_strip_16(png);
    png_set_gray_to_rgb(png);
    if ((img->color_type & PNG_COLOR_MASK_ALPHA) == 0 &&
        png_get_valid(png, info, PNG_INFO_tRNS) == 0)
      png_set_filler(png, 0xFF, PNG_FILLER_AFTER);
  } else if (img->color_type == PNG_COLOR_TYPE_PALETTE) {
    png_colorp plte = nullptr;
    int count = 0;
    if (png_get_PLTE(png, info, &plte, &count) != 0)
      img->palette.assign(plte, plte + count);
  }
  if (png_get_valid(png, info, PNG_INFO_tRNS) != 0) {
    png_bytep alpha = nullptr;
    int count = 0;
    png_color_16p color = nullptr;
    png_get_tRNS(png, info, &alpha, &count, &color);
    if (img->color_type == PNG_COLOR_TYPE_PALETTE && alpha != nullptr) {
      img->trns.assign(alpha, alpha + count);
    } else if (color != nullptr) {
      img->has_trns_color = true;
      img->trns_color = *color;
    }
  }

  if (!rgba && img->bit_depth == 16) {
    png_set_strip_16(png);
    img->stripped_16 = true;
    if (img->has_trns_color) {
      // tRNS values are in 16-bit sample space
      img->trns_color.red >>= 8;
      img->trns_color.green >>= 8;
      img->trns_color.blue >>= 8;
      img->trns_color.gray >>= 8;
    }
  }
  png_set_interlace_handling(png);
  png_read_update_info(png, info);

  img->bit_depth = png_get_bit_depth(png, info);
  img->color_type = png_get_color_type(png, info);
  img->rowbytes = png_get_rowbytes(png, info);
  try {
    img->pixels.resize(img->rowbytes * img->height);
    img->row_ptrs.resize(img->height);
  } catch (const std::bad_alloc&) {
    png_destroy_read_struct(&png, &info, nullptr);
    *error = "out of memory decoding PNG";
    return false;
  }
  for (png_uint_32 y = 0; y < img->height; ++y)
    img->row_ptrs[y] = img->pixels.data() + y * img->rowbytes;

  png_read_image(png, img->row_ptrs.data());
  png_read_end(png, nullptr);
  png_destroy_read_struct(&png, &info, nullptr);
  return true;
}

bool EncodePng(const PngImage& img, std::string* out, std::string* error) {
  png_structp png =
    png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, nullptr,
                            SilentWarning);
  if (png == nullptr) {
    *error = "png_create_write_struct failed";
    return false;
  }
  png_infop info = png_create_info_struct(png);
  if (info == nullptr) {
    png_destroy_write_struct(&png, nullptr);
    *error = "png_create_info_struct failed";
    return false;
  }
  if (setjmp(png_jmpbuf(png))) {
    png_destroy_write_struct(&png, &info);
    *error = "PNG encoding failed";
    return false;
  }

  png_set_write_fn(png, out, WriteToMemory, FlushMemory);
  png_set_compression_level(png, 9);
  png_set_IHDR(png, info, img.width, img.height, img.bit_depth, img.color_type,
               PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
               PNG_FILTER_TYPE_DEFAULT);
  if (!img.palette.empty()) {
    png_set_PLTE(png, info, const_cast<png_colorp>(img.palette.data()),
                 static_cast<int>(img.palette.size()));
  }
  if (!img.trns.empty()) {
    png_set_tRNS(png, info, const_cast<png_bytep>(img.trns.data()),
                 static_cast<int>(img.trns.size()), nullptr);
  } else if (img.has_trns_color) {
    png_set_tRNS(png, info, nullptr, 0,
                 const_cast<png_color_16p>(&img.trns_color));
  }
  png_write_info(png, info);
  for (png_uint_32 y = 0; y < img.height; ++y) {
    png_write_row(png, const_cast<png_bytep>(img.pixels.data() +
                                             y * img.rowbytes));
  }
  png_write_end(png, nullptr);
  png_destroy_write_struct(&png, &info);
  return true;
}

// 8-bit interleaved pixels ready for an encoder.
struct Raster {
  int width{0};
  int height{0};
  int channels{0};  // 3 (RGB) or 4 (RGBA)
  std::vector<unsigned char> pixels;
};

struct JpegError {
  jpeg_error_mgr mgr;
  std::jmp_buf jump;
  char message[JMSG_LENGTH_MAX];
};

void JpegErrorExit(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegError*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  std::longjmp(err->jump, 1);
}

void JpegQuiet(j_common_ptr, int) {
}

// Same setjmp discipline as DecodePng.
bool DecodeJpeg(const std::string& bytes, Raster* img, std::string* error) {
  jpeg_decompress_struct cinfo;
  JpegError err;
  err.message[0] = '\0';
  cinfo.err = jpeg_std_error(&err.mgr);
  err.mgr.error_exit = JpegErrorExit;
  err.mgr.emit_message = JpegQuiet;
  if (setjmp(err.jump)) {
    jpeg_destroy_decompress(&cinfo);
    *error = std::string{"corrupt JPEG: "} + err.message;
    return false;
  }

  jpeg_create_decompress(&cinfo);
  jpeg_mem_src(&cinfo, reinterpret_cast<const unsigned char*>(bytes.data()),
               static_cast<unsigned long>(bytes.size()));
  jpeg_read_header(&cinfo, TRUE);
  if (!WithinBudget(cinfo.image_width, cinfo.image_height, error)) {
    jpeg_destroy_decompress(&cinfo);
    return false;
  }
  cinfo.out_color_space = JCS_RGB;
  jpeg_start_decompress(&cinfo);

  img->width = static_cast<int>(cinfo.output_width);
  img->height = static_cast<int>(cinfo.output_height);
  img->channels = 3;
  const size_t stride = size_t{cinfo.output_width} * 3;
  try {
    img->pixels.resize(stride * cinfo.output_height);
  } catch (const std::bad_alloc&) {
    jpeg_destroy_decompress(&cinfo);
    *error = "out of memory decoding JPEG";
    return false;
  }
  while (cinfo.output_scanline < cinfo.output_height) {
    JSAMPROW row = img->pixels.data() + cinfo.output_scanline * stride;
    jpeg_read_scanlines(&cinfo, &row, 1);
  }
  jpeg_finish_decompress(&cinfo);
  jpeg_destroy_decompress(&cinfo);
  return true;
}

int StringWriter(const uint8_t* data, size_t size, const WebPPicture* picture) {
  auto* out = static_cast<std::string*>(picture->custom_ptr);
  out->append(reinterpret_cast<const char*>(data), size);
  return 1;
}

std::string EncodeRaster(const Raster& img, float quality) {
  if (img.width < 1 || img.height < 1 || img.width > WEBP_MAX_DIMENSION ||
      img.height > WEBP_MAX_DIMENSION)
    throw ImageCodecError("dimensions out of range for WebP");

  WebPConfig config;
  if (!WebPConfigInit(&config))
    throw ImageCodecError("WebPConfigInit() failed");
  config.quality = quality;
  if (!WebPValidateConfig(&config))
    throw ImageCodecError("WebPValidateConfig() failed");

  WebPPicture picture;
  if (!WebPPictureInit(&picture))
    throw ImageCodecError("WebPPictureInit() failed");
  picture.width = img.width;
  picture.height = img.height;
  picture.use_argb = 1;

  const int stride = img.width * img.channels;
  const int imported =
    img.channels == 4
      ? WebPPictureImportRGBA(&picture, img.pixels.data(), stride)
      : WebPPictureImportRGB(&picture, img.pixels.data(), stride);
  if (!imported) {
    WebPPictureFree(&picture);
    throw ImageCodecError("WebPPictureImport failed");
  }

  std::string out;
  picture.writer = StringWriter;
  picture.custom_ptr = &out;
  const int ok = WebPEncode(&config, &picture);
  const WebPEncodingError code = picture.error_code;
  WebPPictureFree(&picture);
  if (!ok)
    throw ImageCodecError("WebPEncode error " + std::to_string(code));
  return out;
}

// Drops the alpha channel in place when every pixel is fully opaque.
bool DropOpaqueAlpha(PngImage& img) {
  int channels = 0;
  if (img.color_type == PNG_COLOR_TYPE_RGB_ALPHA)
    channels = 4;
  else if (img.color_type == PNG_COLOR_TYPE_GRAY_ALPHA)
    channels = 2;
  if (channels == 0 || img.bit_depth != 8)
    return false;

  for (size_t y = 0; y < img.height; ++y) {
    const unsigned char* row = img.pixels.data() + y * img.rowbytes;
    for (size_t x = 0; x < img.width; ++x) {
      if (row[x * channels + channels - 1] != 0xFF)
        return false;
    }
  }

  const int out_channels = channels - 1;
  const size_t out_rowbytes = size_t{img.width} * out_channels;
  std::vector<unsigned char> packed(out_rowbytes * img.height);
  for (size_t y = 0; y < img.height; ++y) {
    const unsigned char* src = img.pixels.data() + y * img.rowbytes;
    unsigned char* dst = packed.data() + y * out_rowbytes;
    for (size_t x = 0; x < img.width; ++x) {
      std::memcpy(dst + x * out_channels, src + x * channels, out_channels);
    }
  }
  img.pixels = std::move(packed);
  img.row_ptrs.clear();
  img.rowbytes = out_rowbytes;
  img.color_type = channels == 4 ? PNG_COLOR_TYPE_RGB : PNG_COLOR_TYPE_GRAY;
  return true;
}
}  // namespace

std::optional<ImageInfo> SniffImage(const std::string& bytes) {
  const auto* d = reinterpret_cast<const unsigned char*>(bytes.data());
  const size_t n = bytes.size();

  static const unsigned char kPngSig[8] = {0x89, 'P', 'N', 'G',
                                           '\r', '\n', 0x1A, '\n'};
  if (n >= 24 && std::memcmp(d, kPngSig, 8) == 0 &&
      std::memcmp(d + 12, "IHDR", 4) == 0) {
    return ImageInfo{"png", static_cast<int>(Be32(d + 16)),
                     static_cast<int>(Be32(d + 20))};
  }
  if (n >= 10 &&
      (std::memcmp(d, "GIF87a", 6) == 0 || std::memcmp(d, "GIF89a", 6) == 0)) {
    return ImageInfo{"gif", static_cast<int>(Le16(d + 6)),
                     static_cast<int>(Le16(d + 8))};
  }
  if (n >= 4 && d[0] == 0xFF && d[1] == 0xD8)
    return SniffJpeg(d, n);
  if (n >= 16 && std::memcmp(d, "RIFF", 4) == 0 &&
      std::memcmp(d + 8, "WEBP", 4) == 0)
    return SniffWebp(d, n);
  return std::nullopt;
}

ReencodedImage ReencodePng(const std::string& bytes) {
  auto info = SniffImage(bytes);
  if (!info.has_value() || info->format != "png")
    throw ImageCodecError("not a PNG image");

  PngImage img;
  std::string error;
  if (!DecodePng(bytes, &img, &error))
    throw ImageCodecError(error);

  ReencodedImage result;
  std::string changes;
  if (img.stripped_16)
    changes = "16-bit to 8-bit channels";
  if (DropOpaqueAlpha(img))
    changes += std::string(changes.empty() ? "" : ", ") + "opaque alpha dropped";
  result.format_changed = !changes.empty();
  result.detail = changes.empty() ? "recompressed" : changes;

  if (!EncodePng(img, &result.bytes, &error))
    throw ImageCodecError(error);
  return result;
}

std::string EncodeWebp(const std::string& bytes, float quality) {
  auto info = SniffImage(bytes);
  if (!info.has_value())
    throw ImageCodecError("unrecognized image format");

  Raster raster;
  std::string error;
  if (info->format == "png") {
    PngImage img;
    if (!DecodePng(bytes, &img, &error, true))
      throw ImageCodecError(error);
    if (img.rowbytes != size_t{img.width} * 4)
      throw ImageCodecError("unexpected PNG row layout");
    raster.width = static_cast<int>(img.width);
    raster.height = static_cast<int>(img.height);
    raster.channels = 4;
    raster.pixels = std::move(img.pixels);
  } else if (info->format == "jpeg") {
    if (!DecodeJpeg(bytes, &raster, &error))
      throw ImageCodecError(error);
  } else {
    throw ImageCodecError("no decoder for " + info->format);
  }
  return EncodeRaster(raster, quality);
}
