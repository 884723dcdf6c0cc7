#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "util/constants.hpp"
#include "util/errc.hpp"

namespace media
{

// Already-compressed image (e.g. WebP) ready to go into a Payload
struct PreparedImage
{
    std::string text;          // base64 of the image bytes
    std::string content_type;  // "image/..."
    std::string filename;
    std::size_t raw_size{0};
};

// ok or validation (not an image type, empty, larger than max_bytes)
errc::Code validate_image(std::size_t       size,
                          std::string_view  content_type,
                          std::size_t       max_bytes = constants::MAX_IMAGE_BYTES);

// Validates and base64-encodes; bytes are NOT compressed again
errc::Code prepare_image(const std::vector<std::uint8_t> &bytes,
                         std::string                      filename,
                         std::string                      content_type,
                         PreparedImage                   &out);

// Inverse of prepare_image's encoding; parse on bad base64
errc::Code decode_image(std::string_view text, std::vector<std::uint8_t> &out);

// MIME type from a file extension; empty if unknown
std::string guess_content_type(std::string_view filename);

// How many ledger ops a ciphertext of this size needs
std::size_t chunks_needed(std::size_t encrypted_size,
                          std::size_t segment = constants::MAX_SEGMENT);

}  // namespace media
