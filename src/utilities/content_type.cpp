#include "utilities/content_type.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace arloader {

namespace {

const std::unordered_map<std::string, std::string> EXTENSIONS = {
    {"html", "text/html"},
    {"htm", "text/html"},
    {"css", "text/css"},
    {"js", "application/javascript"},
    {"mjs", "application/javascript"},
    {"json", "application/json"},
    {"txt", "text/plain"},
    {"md", "text/markdown"},
    {"csv", "text/csv"},
    {"xml", "text/xml"},
    {"svg", "image/svg+xml"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"bmp", "image/bmp"},
    {"ico", "image/x-icon"},
    {"tif", "image/tiff"},
    {"tiff", "image/tiff"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"ogg", "audio/ogg"},
    {"flac", "audio/flac"},
    {"mp4", "video/mp4"},
    {"webm", "video/webm"},
    {"mov", "video/quicktime"},
    {"pdf", "application/pdf"},
    {"zip", "application/zip"},
    {"gz", "application/gzip"},
    {"tar", "application/x-tar"},
    {"wasm", "application/wasm"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"ttf", "font/ttf"},
    {"otf", "font/otf"},
    {"glb", "model/gltf-binary"},
    {"gltf", "model/gltf+json"},
};

struct Magic {
  size_t offset;
  const char *bytes;
  size_t length;
  const char *mime;
};

// Ordered: the first match wins.
const Magic MAGICS[] = {
    {0, "\x89PNG\r\n\x1a\n", 8, "image/png"},
    {0, "\xff\xd8\xff", 3, "image/jpeg"},
    {0, "GIF87a", 6, "image/gif"},
    {0, "GIF89a", 6, "image/gif"},
    {0, "BM", 2, "image/bmp"},
    {0, "II*\0", 4, "image/tiff"},
    {0, "MM\0*", 4, "image/tiff"},
    {0, "\0\0\1\0", 4, "image/x-icon"},
    {0, "%PDF", 4, "application/pdf"},
    {0, "PK\x03\x04", 4, "application/zip"},
    {0, "\x1f\x8b", 2, "application/gzip"},
    {0, "\0asm", 4, "application/wasm"},
    {0, "ID3", 3, "audio/mpeg"},
    {0, "fLaC", 4, "audio/x-flac"},
    {0, "OggS", 4, "audio/ogg"},
    {0, "\x1a\x45\xdf\xa3", 4, "video/webm"},
    {0, "wOFF", 4, "application/font-woff"},
    {0, "wOF2", 4, "application/font-woff"},
    {0, "glTF", 4, "model/gltf-binary"},
    {4, "ftypqt", 6, "video/quicktime"},
    {4, "ftyp", 4, "video/mp4"},
};

bool matchesAt(ByteView data, size_t offset, const char *bytes, size_t len) {
  return data.size() >= offset + len &&
         std::memcmp(data.data() + offset, bytes, len) == 0;
}

} // namespace

std::optional<std::string> mimeFromPath(const std::filesystem::path &path) {
  std::string ext = path.extension().string();
  if (ext.size() < 2)
    return std::nullopt;
  ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  auto it = EXTENSIONS.find(ext);
  if (it == EXTENSIONS.end())
    return std::nullopt;
  return it->second;
}

std::string sniffContentType(ByteView data) {
  // RIFF containers carry the real format at offset 8.
  if (matchesAt(data, 0, "RIFF", 4)) {
    if (matchesAt(data, 8, "WEBP", 4))
      return "image/webp";
    if (matchesAt(data, 8, "WAVE", 4))
      return "audio/x-wav";
    if (matchesAt(data, 8, "AVI ", 4))
      return "video/x-msvideo";
  }
  for (const auto &m : MAGICS) {
    if (matchesAt(data, m.offset, m.bytes, m.length))
      return m.mime;
  }
  return OCTET_STREAM;
}

} // namespace arloader
