#include "Log.hpp"

#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>

#include <cstdarg>
#include <cstdio>

namespace {

// printf mutex
boost::mutex stdio_mutex;

// whether LogInfo prints anything
bool verbose_flag = true;

void
_Print(FILE *_stream, const char *_fmt, va_list _args)
{
    boost::unique_lock<boost::mutex> _scoped(stdio_mutex);
    vfprintf(_stream, _fmt, _args);
    fputc('\n', _stream);
    fflush(_stream);
}

} // namespace

void
LogInfo(const char *_fmt, ...)
{
    {
        boost::unique_lock<boost::mutex> _scoped(stdio_mutex);
        if (!verbose_flag) return;
    }

    va_list _args;
    va_start(_args, _fmt);
    _Print(stdout, _fmt, _args);
    va_end(_args);
}

void
LogError(const char *_fmt, ...)
{
    va_list _args;
    va_start(_args, _fmt);
    _Print(stderr, _fmt, _args);
    va_end(_args);
}

void
SetLogVerbose(bool _verbose)
{
    boost::unique_lock<boost::mutex> _scoped(stdio_mutex);
    verbose_flag = _verbose;
}

std::string
SendFailureMessage(const Command &_cmd, const std::string &_reason)
{
    if (_cmd.type != SET_PIXEL_COMMAND)
        return "failed to send cmd '" + EncodeCommand(_cmd) + "', because: " + _reason;

    char _buffer[0x60];
    snprintf(_buffer, sizeof(_buffer), "failed to paint pixel @ (%u, %u) with #%02x%02x%02x",
             static_cast<unsigned>(_cmd.position.x),
             static_cast<unsigned>(_cmd.position.y),
             static_cast<unsigned>(_cmd.color.r),
             static_cast<unsigned>(_cmd.color.g),
             static_cast<unsigned>(_cmd.color.b));
    return std::string(_buffer) + ", because: " + _reason;
}

void
LogSendFailure(const Command &_cmd, const std::string &_reason)
{
    LogError("%s", SendFailureMessage(_cmd, _reason).c_str());
}
