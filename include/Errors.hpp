#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/// base class for every error pixelspray reports
class PixelsprayError : public std::runtime_error {
public:
    explicit PixelsprayError(const std::string &_what) :
        std::runtime_error(_what)
    {
    }
};

/// DNS resolution, address parsing or tcp handshake failed
class ConnectError : public PixelsprayError {
public:
    explicit ConnectError(const std::string &_what) :
        PixelsprayError(_what)
    {
    }
};

/// server reply is malformed
class ProtocolError : public PixelsprayError {
public:
    explicit ProtocolError(const std::string &_what) :
        PixelsprayError(_what)
    {
    }
};

/// read or write failed on an established connection
class IoError : public PixelsprayError {
public:
    explicit IoError(const std::string &_what) :
        PixelsprayError(_what)
    {
    }
};

/// image can't be opened or decoded
class ImageError : public PixelsprayError {
public:
    explicit ImageError(const std::string &_what) :
        PixelsprayError(_what)
    {
    }
};

#endif // ERRORS_HPP
