#include <gtest/gtest.h>
#include <string>

#include "crypto/digest.hpp"
#include "proto/payload.hpp"

using namespace payload;

static Payload sample()
{
    Payload p;
    p.image_data   = "X";
    p.caption      = "hi";
    p.filename     = "a.webp";
    p.content_type = "image/webp";
    p.from         = "alice";
    p.to           = "bob";
    p.timestamp    = 1000;
    return p;
}

TEST(Payload, EncodeDecode_ExactRoundtrip)
{
    const Payload  p = sample();
    CompactPayload c;
    ASSERT_EQ(encode(p, c), errc::Code::ok);

    Payload back;
    ASSERT_EQ(decode(c, back), errc::Code::ok);
    EXPECT_EQ(back, p);
    ASSERT_TRUE(back.caption.has_value());
    EXPECT_EQ(*back.caption, "hi");
}

TEST(Payload, CanonicalKeyOrder_NoWhitespace)
{
    CompactPayload c;
    ASSERT_EQ(encode(sample(), c), errc::Code::ok);
    EXPECT_EQ(c.text, R"({"t":"bob","f":"alice","i":"X","m":"hi","n":"a.webp",)"
                      R"("c":"image/webp","ts":1000})");
}

TEST(Payload, Caption_OmittedWhenAbsentOrEmpty)
{
    Payload p = sample();
    p.caption.reset();
    CompactPayload c;
    ASSERT_EQ(encode(p, c), errc::Code::ok);
    EXPECT_EQ(c.text.find("\"m\""), std::string::npos);

    Payload back;
    ASSERT_EQ(decode(c, back), errc::Code::ok);
    EXPECT_FALSE(back.caption.has_value());
    EXPECT_EQ(back, p);

    // empty caption encodes like no caption
    p.caption = std::string();
    CompactPayload c2;
    ASSERT_EQ(encode(p, c2), errc::Code::ok);
    EXPECT_EQ(c2.text, c.text);
}

TEST(Payload, Hash_IsSha256OfCanonicalText)
{
    CompactPayload c;
    ASSERT_EQ(encode(sample(), c), errc::Code::ok);
    const std::string h = hash(c);
    EXPECT_TRUE(digest::is_sha256_hex(h));
    EXPECT_EQ(h, digest::sha256_hex(c.text));

    // same payload, same text, same hash
    CompactPayload again;
    ASSERT_EQ(encode(sample(), again), errc::Code::ok);
    EXPECT_EQ(hash(again), h);

    Payload other = sample();
    other.timestamp++;
    CompactPayload c3;
    ASSERT_EQ(encode(other, c3), errc::Code::ok);
    EXPECT_NE(hash(c3), h);
}

TEST(Payload, Hash_KnownVector)
{
    // sha256("abc")
    CompactPayload c{"abc"};
    EXPECT_EQ(hash(c), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Payload, Encode_RejectsMissingFields)
{
    CompactPayload c;
    Payload        p = sample();
    p.from.clear();
    EXPECT_EQ(encode(p, c), errc::Code::validation);

    p = sample();
    p.image_data.clear();
    EXPECT_EQ(encode(p, c), errc::Code::validation);

    p = sample();
    p.content_type.clear();
    EXPECT_EQ(encode(p, c), errc::Code::validation);
}

TEST(Payload, Encode_RejectsInvalidUtf8)
{
    Payload p = sample();
    p.caption = std::string("\xff\xfe", 2);
    CompactPayload c;
    EXPECT_EQ(encode(p, c), errc::Code::validation);
}

TEST(Payload, Decode_RejectsJunk)
{
    Payload out;
    EXPECT_EQ(decode(CompactPayload{"not json"}, out), errc::Code::parse);
    EXPECT_EQ(decode(CompactPayload{"[1,2]"}, out), errc::Code::parse);
    // ts as string
    EXPECT_EQ(decode(CompactPayload{R"({"t":"b","f":"a","i":"X","n":"a","c":"image/png",)"
                                    R"("ts":"1"})"},
                     out),
              errc::Code::parse);
    // missing filename
    EXPECT_EQ(decode(CompactPayload{R"({"t":"b","f":"a","i":"X","c":"image/png","ts":1})"}, out),
              errc::Code::parse);
    // caption of the wrong type
    EXPECT_EQ(decode(CompactPayload{R"({"t":"b","f":"a","i":"X","m":5,"n":"a",)"
                                    R"("c":"image/png","ts":1})"},
                     out),
              errc::Code::parse);
}
