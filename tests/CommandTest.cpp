#include "Command.hpp"
#include "Errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

namespace {

// parses "PX x y rrggbb" independently of the encoder
bool
DecodeSetPixel(const std::string &_line, Vec2 &_position, Rgb &_color)
{
    unsigned _x, _y, _r, _g, _b;
    char _hex[7];
    int _consumed = 0;

    if (sscanf(_line.c_str(), "PX %u %u %6[0-9a-f]%n", &_x, &_y, _hex, &_consumed) != 3)
        return false;
    if (static_cast<std::size_t>(_consumed) != _line.size() || std::string(_hex).size() != 6)
        return false;
    if (sscanf(_hex, "%2x%2x%2x", &_r, &_g, &_b) != 3)
        return false;

    _position = MakeVec2(_x, _y);
    _color = MakeRgb(_r, _g, _b);
    return true;
}

} // namespace

TEST(CommandTest, EncodesEveryCommand)
{
    EXPECT_EQ("HELP", EncodeCommand(HelpCommand()));
    EXPECT_EQ("SIZE", EncodeCommand(SizeCommand()));
    EXPECT_EQ("PX 12 34 abcdef",
              EncodeCommand(SetPixelCommand(MakeVec2(12, 34), MakeRgb(0xab, 0xcd, 0xef))));
    EXPECT_EQ("PX 5 6", EncodeCommand(GetPixelCommand(MakeVec2(5, 6))));
}

TEST(CommandTest, LineIsNewlineTerminated)
{
    EXPECT_EQ("SIZE\n", EncodeCommandLine(SizeCommand()));
    EXPECT_EQ("PX 0 0 000000\n",
              EncodeCommandLine(SetPixelCommand(MakeVec2(0, 0), MakeRgb(0, 0, 0))));
}

TEST(CommandTest, HexIsZeroPaddedLowercase)
{
    EXPECT_EQ("PX 0 0 0102ff",
              EncodeCommand(SetPixelCommand(MakeVec2(0, 0), MakeRgb(1, 2, 255))));
    EXPECT_EQ("PX 4294967295 4294967295 0a0b0c",
              EncodeCommand(SetPixelCommand(MakeVec2(4294967295u, 4294967295u),
                                            MakeRgb(10, 11, 12))));
}

TEST(CommandTest, SetPixelDecodesBack)
{
    const unsigned _samples[][5] = {
        {0, 0, 0, 0, 0},
        {1, 2, 255, 255, 255},
        {799, 599, 16, 15, 1},
        {123456, 7, 128, 0, 200},
    };

    for (std::size_t i = 0; i < sizeof(_samples) / sizeof(_samples[0]); ++i) {
        Vec2 _position = MakeVec2(_samples[i][0], _samples[i][1]);
        Rgb _color = MakeRgb(_samples[i][2], _samples[i][3], _samples[i][4]);
        std::string _line = EncodeCommand(SetPixelCommand(_position, _color));

        Vec2 _decoded_position;
        Rgb _decoded_color;
        ASSERT_TRUE(DecodeSetPixel(_line, _decoded_position, _decoded_color)) << _line;
        EXPECT_EQ(_position, _decoded_position) << _line;
        EXPECT_EQ(_color, _decoded_color) << _line;
    }
}

TEST(CommandTest, ParsesSizeReply)
{
    EXPECT_EQ(MakeVec2(800, 600), ParseSizeReply("SIZE 800 600\n"));
    EXPECT_EQ(MakeVec2(800, 600), ParseSizeReply("SIZE 800 600"));
    EXPECT_EQ(MakeVec2(1920, 1080), ParseSizeReply("SIZE 1920 1080\r\n"));
    // leading token isn't checked
    EXPECT_EQ(MakeVec2(3, 4), ParseSizeReply("CANVAS 3 4\n"));
}

TEST(CommandTest, RejectsMissingFields)
{
    EXPECT_THROW(ParseSizeReply("SIZE 800\n"), ProtocolError);
    EXPECT_THROW(ParseSizeReply("SIZE\n"), ProtocolError);
    EXPECT_THROW(ParseSizeReply(""), ProtocolError);
}

TEST(CommandTest, RejectsBadFields)
{
    EXPECT_THROW(ParseSizeReply("SIZE abc 600\n"), ProtocolError);
    EXPECT_THROW(ParseSizeReply("SIZE 800 6o0\n"), ProtocolError);
    EXPECT_THROW(ParseSizeReply("SIZE -1 600\n"), ProtocolError);
    EXPECT_THROW(ParseSizeReply("SIZE 800 4294967296\n"), ProtocolError);
    EXPECT_THROW(ParseSizeReply("SIZE 800 600 extra\n"), ProtocolError);
}
