#include <gtest/gtest.h>
#include <string_view>
#include <vector>
#include "PlatformDetection.h"

namespace
{
    bool IsValidText(std::string_view text)
    {
        std::vector<Byte> bytes(text.begin(), text.end());
        return IsValidUtf8(bytes);
    }
}

TEST(PlatformDetectionTests, BigEndian)
{
    Bytes<4> bytes{ 0x12, 0x34, 0x56, 0x78 };
    EXPECT_EQ(ReadBigEndian<std::uint32_t>(std::span<const Byte, 4>{ bytes }), 0x12345678u);
    EXPECT_EQ(ToBigEndian<std::uint32_t>(0x12345678u), bytes);

    std::vector<Byte> out;
    AppendBigEndian<std::uint32_t>(out, 2882656334u);
    EXPECT_EQ(out, (std::vector<Byte>{ 0xAB, 0xD1, 0xD8, 0x4E }));
}

TEST(PlatformDetectionTests, Utf8)
{
    EXPECT_TRUE(IsValidText(""));
    EXPECT_TRUE(IsValidText("RuSt"));
    EXPECT_TRUE(IsValidText("\xC3\xA9"));
    EXPECT_TRUE(IsValidText("\xF0\x9F\x98\x80"));

    EXPECT_FALSE(IsValidText("\xFF"));
    EXPECT_FALSE(IsValidText("\xC3"));
    EXPECT_FALSE(IsValidText("\xC0\xAF"));
    EXPECT_FALSE(IsValidText("\xED\xA0\x80"));
    EXPECT_FALSE(IsValidText("\xF4\x90\x80\x80"));
    EXPECT_FALSE(IsValidText("\x80"));
}

TEST(PlatformDetectionTests, ErrorMessages)
{
    EXPECT_EQ(ToString(PNGError::Checksum_Mismatch), "Chunk does not match checksum");
    EXPECT_FALSE(ToString(PNGError::File_Read_Failure).empty());
}
