#include "Command.hpp"
#include "Errors.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include <cstdio>
#include <vector>

namespace {

boost::uint32_t
_ParseSizeField(const std::string &_field, const char *_what)
{
    if (_field.empty() ||
        _field.find_first_not_of("0123456789") != std::string::npos)
        throw ProtocolError(std::string("server gave invalid ") + _what +
                            " in response to SIZE: '" + _field + "'");

    try {
        return boost::lexical_cast<boost::uint32_t>(_field);
    } catch (const boost::bad_lexical_cast &) {
        throw ProtocolError(std::string("server gave out of range ") + _what +
                            " in response to SIZE: '" + _field + "'");
    }
}

} // namespace

Vec2
MakeVec2(boost::uint32_t _x, boost::uint32_t _y)
{
    Vec2 _v;
    _v.x = _x;
    _v.y = _y;
    return _v;
}

Rgb
MakeRgb(boost::uint8_t _r, boost::uint8_t _g, boost::uint8_t _b)
{
    Rgb _c;
    _c.r = _r;
    _c.g = _g;
    _c.b = _b;
    return _c;
}

Command
HelpCommand()
{
    Command _cmd = Command();
    _cmd.type = HELP_COMMAND;
    return _cmd;
}

Command
SizeCommand()
{
    Command _cmd = Command();
    _cmd.type = SIZE_COMMAND;
    return _cmd;
}

Command
SetPixelCommand(const Vec2 &_position, const Rgb &_color)
{
    Command _cmd = Command();
    _cmd.type = SET_PIXEL_COMMAND;
    _cmd.position = _position;
    _cmd.color = _color;
    return _cmd;
}

Command
GetPixelCommand(const Vec2 &_position)
{
    Command _cmd = Command();
    _cmd.type = GET_PIXEL_COMMAND;
    _cmd.position = _position;
    return _cmd;
}

std::string
EncodeCommand(const Command &_cmd)
{
    // "PX 4294967295 4294967295 ffffff" fits easily
    char _buffer[0x40];
    int _length = 0;

    switch (_cmd.type) {
    case HELP_COMMAND:
        return "HELP";
    case SIZE_COMMAND:
        return "SIZE";
    case SET_PIXEL_COMMAND:
        _length = snprintf(_buffer, sizeof(_buffer), "PX %u %u %02x%02x%02x",
                           static_cast<unsigned>(_cmd.position.x),
                           static_cast<unsigned>(_cmd.position.y),
                           static_cast<unsigned>(_cmd.color.r),
                           static_cast<unsigned>(_cmd.color.g),
                           static_cast<unsigned>(_cmd.color.b));
        break;
    case GET_PIXEL_COMMAND:
        _length = snprintf(_buffer, sizeof(_buffer), "PX %u %u",
                           static_cast<unsigned>(_cmd.position.x),
                           static_cast<unsigned>(_cmd.position.y));
        break;
    }

    return std::string(_buffer, _length > 0 ? _length : 0);
}

std::string
EncodeCommandLine(const Command &_cmd)
{
    return EncodeCommand(_cmd) + '\n';
}

Vec2
ParseSizeReply(const std::string &_line)
{
    std::string _trimmed = boost::algorithm::trim_copy(_line);
    std::vector<std::string> _fields;

    if (!_trimmed.empty())
        boost::algorithm::split(_fields, _trimmed,
                                boost::algorithm::is_any_of(" \t"),
                                boost::algorithm::token_compress_on);

    // leading token is skipped
    if (_fields.size() < 2)
        throw ProtocolError("server gave no width in response to SIZE");
    if (_fields.size() < 3)
        throw ProtocolError("server gave no height in response to SIZE");
    if (_fields.size() > 3)
        throw ProtocolError("server gave trailing data in response to SIZE: '" +
                            _trimmed + "'");

    return MakeVec2(_ParseSizeField(_fields[1], "width"),
                    _ParseSizeField(_fields[2], "height"));
}

bool
operator==(const Vec2 &_a, const Vec2 &_b)
{
    return _a.x == _b.x && _a.y == _b.y;
}

bool
operator!=(const Vec2 &_a, const Vec2 &_b)
{
    return !(_a == _b);
}

bool
operator==(const Rgb &_a, const Rgb &_b)
{
    return _a.r == _b.r && _a.g == _b.g && _a.b == _b.b;
}

bool
operator!=(const Rgb &_a, const Rgb &_b)
{
    return !(_a == _b);
}
