#ifndef MIME_HPP
#define MIME_HPP

#include <optional>
#include <string>
#include <string_view>

namespace mime {

// MIME type for a recognized audio extension (case-insensitive, no dot).
std::optional<std::string> audio_type(std::string_view extension);

bool is_audio_target(std::string_view target);

// MIME type for an image extension. Known extensions map through a table,
// any other non-empty extension becomes "image/<ext>", an empty one
// falls back to image/png.
std::string image_type(std::string_view extension);

} // namespace mime

#endif
