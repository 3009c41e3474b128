#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <boost/cstdint.hpp>
#include <string>

/// canvas coordinate, or canvas size when read as (width, height)
typedef struct _Vec2 {
    boost::uint32_t x;
    boost::uint32_t y;
} Vec2;

/// 24-bit color
typedef struct _Rgb {
    boost::uint8_t r;
    boost::uint8_t g;
    boost::uint8_t b;
} Rgb;

/// one pixel of the image to paint
typedef struct _Pixel {
    Vec2 position;
    Rgb color;
} Pixel;

/// pixelflut command kinds
typedef enum _CommandType {
    HELP_COMMAND = 0,
    SIZE_COMMAND,
    SET_PIXEL_COMMAND,
    GET_PIXEL_COMMAND
} CommandType;

/*!
 * \brief The Command struct is a pixelflut command
 * position is meaningful for SET_PIXEL_COMMAND and GET_PIXEL_COMMAND,
 * color for SET_PIXEL_COMMAND only
 */
typedef struct _Command {
    CommandType type;
    Vec2 position;
    Rgb color;
} Command;

Vec2 MakeVec2(boost::uint32_t _x, boost::uint32_t _y);
Rgb MakeRgb(boost::uint8_t _r, boost::uint8_t _g, boost::uint8_t _b);

Command HelpCommand();
Command SizeCommand();
Command SetPixelCommand(const Vec2 &_position, const Rgb &_color);
Command GetPixelCommand(const Vec2 &_position);

/*!
 * \brief encode command as wire text
 * \return line without the trailing newline
 */
std::string EncodeCommand(const Command &_cmd);

/*!
 * \brief encode command as wire text terminated with '\n'
 */
std::string EncodeCommandLine(const Command &_cmd);

/*!
 * \brief decode server reply to SIZE
 * \param _line "SIZE <width> <height>", trailing "\r\n" allowed
 * \return canvas size
 * \throw ProtocolError if the reply doesn't carry exactly two
 * unsigned fields after the leading token
 */
Vec2 ParseSizeReply(const std::string &_line);

bool operator==(const Vec2 &_a, const Vec2 &_b);
bool operator!=(const Vec2 &_a, const Vec2 &_b);
bool operator==(const Rgb &_a, const Rgb &_b);
bool operator!=(const Rgb &_a, const Rgb &_b);

#endif // COMMAND_HPP
