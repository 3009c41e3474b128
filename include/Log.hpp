#ifndef LOG_HPP
#define LOG_HPP

#include "Command.hpp"

#include <string>

/*
 * console output shared by every thread.
 * each call prints one whole line under a single mutex so lines
 * of different workers never interleave.
 */

/// status line to stdout (dropped when not verbose)
void LogInfo(const char *_fmt, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

/// error line to stderr (always printed)
void LogError(const char *_fmt, ...)
#ifdef __GNUC__
    __attribute__((format(printf, 1, 2)))
#endif
    ;

/// enable or disable status lines, enabled by default
void SetLogVerbose(bool _verbose);

/*!
 * \brief describe a send that failed
 * "failed to paint pixel @ (x, y) with #rrggbb, because: _reason" for
 * SET_PIXEL_COMMAND, "failed to send cmd '...', because: _reason" otherwise
 */
std::string SendFailureMessage(const Command &_cmd, const std::string &_reason);

/// SendFailureMessage to stderr
void LogSendFailure(const Command &_cmd, const std::string &_reason);

#endif // LOG_HPP
