#include <gtest/gtest.h>
#include <vector>
#include "ImageHeader.h"

namespace
{
    ImageHeader SampleHeader()
    {
        ImageHeader header;
        header.width = 640;
        header.height = 480;
        header.bitDepth = 8;
        header.colorType = ColorType::TruecolorWithAlpha;
        header.interlaceMethod = InterlaceMethod::Adam7;
        return header;
    }

    std::vector<Byte> HeaderData(std::uint32_t width, std::uint32_t height, Byte bitDepth, Byte colorType, Byte compression = 0, Byte filter = 0, Byte interlace = 0)
    {
        std::vector<Byte> data;
        AppendBigEndian(data, width);
        AppendBigEndian(data, height);
        data.insert(data.end(), { bitDepth, colorType, compression, filter, interlace });
        return data;
    }

    PNGError ParseError(std::vector<Byte> data)
    {
        return ImageHeader::Parse(Chunk{ ChunkIdentifiers::header, std::move(data) }).error();
    }
}

TEST(ImageHeaderTests, ChunkRoundTrip)
{
    ImageHeader header = SampleHeader();
    Chunk chunk = header.ToChunk();
    EXPECT_TRUE(chunk.Type() == ChunkIdentifiers::header);
    EXPECT_EQ(chunk.Length(), ImageHeader::dataSize);

    auto parsed = ImageHeader::Parse(chunk);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->width, 640u);
    EXPECT_EQ(parsed->height, 480u);
    EXPECT_EQ(parsed->bitDepth, 8);
    EXPECT_EQ(parsed->colorType, ColorType::TruecolorWithAlpha);
    EXPECT_EQ(parsed->compressionMethod, 0);
    EXPECT_EQ(parsed->filterMethod, 0);
    EXPECT_EQ(parsed->interlaceMethod, InterlaceMethod::Adam7);
}

TEST(ImageHeaderTests, ParsesBigEndianFields)
{
    auto parsed = ImageHeader::Parse(Chunk{ ChunkIdentifiers::header, HeaderData(0x01020304, 0x00000010, 16, 0) });
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->width, 0x01020304u);
    EXPECT_EQ(parsed->height, 16u);
    EXPECT_EQ(parsed->colorType, ColorType::GreyScale);
}

TEST(ImageHeaderTests, WrongChunkType)
{
    auto parsed = ImageHeader::Parse(Chunk{ ChunkIdentifiers::imageData, HeaderData(1, 1, 8, 2) });
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error(), PNGError::Unexpected_Chunk_Type);
}

TEST(ImageHeaderTests, WrongChunkSize)
{
    std::vector<Byte> data = HeaderData(1, 1, 8, 2);
    data.push_back(0);
    EXPECT_EQ(ParseError(data), PNGError::Unexpected_Chunk_Size);
    EXPECT_EQ(ParseError({}), PNGError::Unexpected_Chunk_Size);
}

TEST(ImageHeaderTests, InvalidDimensions)
{
    EXPECT_EQ(ParseError(HeaderData(0, 1, 8, 2)), PNGError::Invalid_Dimensions);
    EXPECT_EQ(ParseError(HeaderData(1, 0, 8, 2)), PNGError::Invalid_Dimensions);
    EXPECT_EQ(ParseError(HeaderData(0x80000000, 1, 8, 2)), PNGError::Invalid_Dimensions);
    EXPECT_TRUE(ImageHeader::Parse(Chunk{ ChunkIdentifiers::header, HeaderData(0x7FFFFFFF, 1, 8, 2) }).has_value());
}

TEST(ImageHeaderTests, UnsupportedColorType)
{
    EXPECT_EQ(ParseError(HeaderData(1, 1, 8, 1)), PNGError::Unsupported_Color_Format);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 8, 5)), PNGError::Unsupported_Color_Format);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 8, 7)), PNGError::Unsupported_Color_Format);
}

TEST(ImageHeaderTests, BitDepthPerColorType)
{
    for(Byte depth : { 1, 2, 4, 8, 16 })
        EXPECT_TRUE(ImageHeader::Parse(Chunk{ ChunkIdentifiers::header, HeaderData(1, 1, depth, 0) }).has_value());

    EXPECT_EQ(ParseError(HeaderData(1, 1, 16, 3)), PNGError::Invalid_Bit_Depth);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 4, 2)), PNGError::Invalid_Bit_Depth);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 1, 4)), PNGError::Invalid_Bit_Depth);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 3, 0)), PNGError::Invalid_Bit_Depth);
}

TEST(ImageHeaderTests, UnknownMethods)
{
    EXPECT_EQ(ParseError(HeaderData(1, 1, 8, 2, 1, 0, 0)), PNGError::Unknown_Compression_Method);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 8, 2, 0, 1, 0)), PNGError::Unknown_Filter_Type);
    EXPECT_EQ(ParseError(HeaderData(1, 1, 8, 2, 0, 0, 2)), PNGError::Unknown_Interlace_Method);
}

TEST(ImageHeaderTests, ColorTypeQueries)
{
    ImageHeader header = SampleHeader();
    EXPECT_FALSE(header.UsesPalette());
    EXPECT_TRUE(header.UsesColor());
    EXPECT_TRUE(header.UsesAlpha());
    EXPECT_EQ(header.SubpixelCount().value(), 4);
    EXPECT_EQ(header.ColorTypeName().value(), "True Color with Alpha");
    EXPECT_EQ(header.SampleDepth(), 8);

    header.colorType = ColorType::IndexedColor;
    header.bitDepth = 2;
    EXPECT_TRUE(header.UsesPalette());
    EXPECT_TRUE(header.UsesColor());
    EXPECT_FALSE(header.UsesAlpha());
    EXPECT_EQ(header.SubpixelCount().value(), 1);
    EXPECT_EQ(header.SampleDepth(), 8);

    header.colorType = ColorType::GreyScale;
    EXPECT_EQ(header.SampleDepth(), 2);
}
