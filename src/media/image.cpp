#include <algorithm>
#include <cctype>
#include <cstring>
#include <sodium.h>

#include "crypto/digest.hpp"
#include "media/image.hpp"
#include "util/log.hpp"

namespace media
{

errc::Code validate_image(std::size_t size, std::string_view content_type, std::size_t max_bytes)
{
    if (content_type.rfind("image/", 0) != 0)
    {
        LOG_ERROR("validate_image: '%.*s' is not an image type", (int)content_type.size(),
                  content_type.data());
        return errc::Code::validation;
    }
    if (size == 0)
    {
        LOG_ERROR("validate_image: empty image");
        return errc::Code::validation;
    }
    if (size > max_bytes)
    {
        LOG_ERROR("validate_image: %zu bytes exceeds limit of %zu", size, max_bytes);
        return errc::Code::validation;
    }
    return errc::Code::ok;
}

errc::Code prepare_image(const std::vector<std::uint8_t> &bytes,
                         std::string                      filename,
                         std::string                      content_type,
                         PreparedImage                   &out)
{
    if (auto rc = validate_image(bytes.size(), content_type); rc != errc::Code::ok)
        return rc;
    if (filename.empty())
    {
        LOG_ERROR("prepare_image: missing filename");
        return errc::Code::validation;
    }
    digest::sodium_ready();

    const std::size_t b64_len =
        sodium_base64_ENCODED_LEN(bytes.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string b64(b64_len, '\0');
    sodium_bin2base64(b64.data(), b64.size(), bytes.data(), bytes.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    b64.resize(std::strlen(b64.c_str()));

    TLOG_DEBUG(Image, "%s: %zu bytes -> %zu base64 chars", filename.c_str(), bytes.size(),
               b64.size());
    out.text         = std::move(b64);
    out.content_type = std::move(content_type);
    out.filename     = std::move(filename);
    out.raw_size     = bytes.size();
    return errc::Code::ok;
}

errc::Code decode_image(std::string_view text, std::vector<std::uint8_t> &out)
{
    digest::sodium_ready();
    std::vector<std::uint8_t> bin(text.size() / 4 * 3 + 3);
    std::size_t               bin_len = 0;
    if (sodium_base642bin(bin.data(), bin.size(), text.data(), text.size(), nullptr, &bin_len,
                          nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        LOG_ERROR("decode_image: image data is not valid base64");
        return errc::Code::parse;
    }
    bin.resize(bin_len);
    out = std::move(bin);
    return errc::Code::ok;
}

std::string guess_content_type(std::string_view filename)
{
    const auto dot = filename.rfind('.');
    if (dot == std::string_view::npos)
        return {};
    std::string ext(filename.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == "webp")
        return "image/webp";
    if (ext == "png")
        return "image/png";
    if (ext == "jpg" || ext == "jpeg")
        return "image/jpeg";
    if (ext == "gif")
        return "image/gif";
    if (ext == "avif")
        return "image/avif";
    return {};
}

std::size_t chunks_needed(std::size_t encrypted_size, std::size_t segment)
{
    if (segment == 0)
        return 0;
    return (encrypted_size + segment - 1) / segment;
}

}  // namespace media
