#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "media/image.hpp"

using namespace media;

TEST(Media, ValidateImage)
{
    EXPECT_EQ(validate_image(10, "image/webp"), errc::Code::ok);
    EXPECT_EQ(validate_image(0, "image/webp"), errc::Code::validation);
    EXPECT_EQ(validate_image(10, "text/plain"), errc::Code::validation);
    EXPECT_EQ(validate_image(constants::MAX_IMAGE_BYTES, "image/png"), errc::Code::ok);
    EXPECT_EQ(validate_image(constants::MAX_IMAGE_BYTES + 1, "image/png"),
              errc::Code::validation);
    EXPECT_EQ(validate_image(11, "image/png", 10), errc::Code::validation);
}

TEST(Media, PrepareDecode_Base64)
{
    const std::vector<std::uint8_t> bytes = {'R', 'I', 'F', 'F', 0x00, 0xff, 0x10};
    PreparedImage                   img;
    ASSERT_EQ(prepare_image(bytes, "cat.webp", "image/webp", img), errc::Code::ok);
    EXPECT_EQ(img.text, "UklGRgD/EA==");
    EXPECT_EQ(img.filename, "cat.webp");
    EXPECT_EQ(img.content_type, "image/webp");
    EXPECT_EQ(img.raw_size, bytes.size());

    std::vector<std::uint8_t> back;
    ASSERT_EQ(decode_image(img.text, back), errc::Code::ok);
    EXPECT_EQ(back, bytes);
}

TEST(Media, Prepare_RejectsBadInput)
{
    PreparedImage img;
    EXPECT_EQ(prepare_image({}, "a.png", "image/png", img), errc::Code::validation);
    EXPECT_EQ(prepare_image({1, 2, 3}, "", "image/png", img), errc::Code::validation);
    EXPECT_EQ(prepare_image({1, 2, 3}, "a.txt", "text/plain", img), errc::Code::validation);
}

TEST(Media, Decode_RejectsNonBase64)
{
    std::vector<std::uint8_t> out;
    EXPECT_EQ(decode_image("***", out), errc::Code::parse);
}

TEST(Media, GuessContentType)
{
    EXPECT_EQ(guess_content_type("a.webp"), "image/webp");
    EXPECT_EQ(guess_content_type("dir/A.PNG"), "image/png");
    EXPECT_EQ(guess_content_type("x.jpeg"), "image/jpeg");
    EXPECT_EQ(guess_content_type("x.jpg"), "image/jpeg");
    EXPECT_EQ(guess_content_type("x.gif"), "image/gif");
    EXPECT_EQ(guess_content_type("notes.txt"), "");
    EXPECT_EQ(guess_content_type("noext"), "");
}

TEST(Media, ChunksNeeded)
{
    EXPECT_EQ(chunks_needed(1), 1u);
    EXPECT_EQ(chunks_needed(7000), 1u);
    EXPECT_EQ(chunks_needed(7001), 2u);
    EXPECT_EQ(chunks_needed(21000), 3u);
    EXPECT_EQ(chunks_needed(100, 0), 0u);
}
