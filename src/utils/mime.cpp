#include "mime.hpp"
#include "text.hpp"

#include <unordered_map>

namespace mime {

static const std::unordered_map<std::string, std::string> &audio_types() {
  static const std::unordered_map<std::string, std::string> types = {
      {"mp3", "audio/mpeg"},  {"wav", "audio/wav"},  {"ogg", "audio/ogg"},
      {"oga", "audio/ogg"},   {"opus", "audio/opus"}, {"m4a", "audio/mp4"},
      {"aac", "audio/aac"},   {"flac", "audio/flac"}, {"weba", "audio/webm"},
  };
  return types;
}

static const std::unordered_map<std::string, std::string> &image_types() {
  static const std::unordered_map<std::string, std::string> types = {
      {"png", "image/png"},   {"jpg", "image/jpeg"},
      {"jpeg", "image/jpeg"}, {"gif", "image/gif"},
      {"svg", "image/svg+xml"}, {"webp", "image/webp"},
  };
  return types;
}

std::optional<std::string> audio_type(std::string_view extension) {
  const auto &types = audio_types();
  auto it = types.find(text::to_lower(extension));
  if (it == types.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool is_audio_target(std::string_view target) {
  std::string ext = text::extension_of(target);
  return !ext.empty() && audio_type(ext).has_value();
}

std::string image_type(std::string_view extension) {
  if (extension.empty()) {
    return "image/png";
  }
  std::string ext = text::to_lower(extension);
  const auto &types = image_types();
  auto it = types.find(ext);
  if (it != types.end()) {
    return it->second;
  }
  return "image/" + ext;
}

} // namespace mime
