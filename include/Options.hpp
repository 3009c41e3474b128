#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include "Dispatcher.hpp"
#include "ImageSource.hpp"

#include <cstddef>
#include <string>

/// command line, already validated
typedef struct _Options {
    DispatchConfig dispatch;
    ImageOptions image;
    std::string image_path;
    std::size_t chunks;
    bool quiet;
} Options;

/// defaults of every option, server and image path empty
Options DefaultOptions();

/*!
 * \brief parse argv into _options
 * counts must be positive; negative numbers are rejected, never wrapped
 * \return false if usage was printed and there's nothing to do
 * \throw boost::program_options::error on bad command line
 */
bool ParseOptions(int argc, const char *const argv[], Options &_options);

/// one line usage hint
std::string UsageLine(const char *_program);

#endif // OPTIONS_HPP
