#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

struct ImageInfo {
  std::string format;  // "png", "gif", "jpeg", "webp"
  int width{0};
  int height{0};
};

// Intrinsic dimensions from the file header; nullopt for unknown formats or
// truncated headers.
std::optional<ImageInfo> SniffImage(const std::string& bytes);

class ImageCodecError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Decoders refuse images with more pixels than this before allocating.
constexpr std::uint64_t kMaxImagePixels = 40000000;

struct ReencodedImage {
  std::string bytes;
  // 16-bit channels reduced or an opaque alpha channel dropped
  bool format_changed{false};
  std::string detail;  // human-readable summary of what changed
};

// Decodes a PNG and writes it back at maximum zlib compression without
// ancillary chunks. Throws ImageCodecError if the input is not a readable
// PNG. The result may be larger than the input; callers decide.
ReencodedImage ReencodePng(const std::string& bytes);

constexpr float kWebpQuality = 85.0f;

// Decodes a PNG or JPEG and encodes it as lossy WebP, keeping PNG alpha.
// Throws ImageCodecError for other formats, oversized or unreadable input.
std::string EncodeWebp(const std::string& bytes, float quality = kWebpQuality);
