#ifndef COMMANDIO_HPP
#define COMMANDIO_HPP

#include "Command.hpp"

#include <boost/shared_ptr.hpp>
#include <string>

/*!
 * \brief The CommandIO is command i/o operation interface class
 * General route is like:
 * - user creates Connection (or a test double), never CommandIO directly
 * - connect
 * - call to QuerySize once to learn canvas size
 * - call to Send for every command to paint
 *
 * Derivatives should implement Send and ReadLine.
 * A CommandIO is not thread safe: at most one thread may use it at a time.
 */
class CommandIO {
public:
    virtual
    ~CommandIO()
    {
    }

    /*!
     * \brief write a whole command line and flush it
     * \throw IoError on write failure
     */
    virtual
    void Send(const Command &_cmd) = 0;

    /*!
     * \brief read one line (newline stripped)
     * \return line, empty at clean end of stream
     * \throw IoError on stream error
     */
    virtual
    std::string ReadLine() = 0;

    /*!
     * \brief ask the server for canvas size
     * (default implementation: SIZE, read reply, parse it)
     * \throw IoError, ProtocolError
     */
    virtual
    Vec2 QuerySize()
    {
        Send(SizeCommand());
        return ParseSizeReply(ReadLine());
    }
};

/// command i/o pointer
typedef boost::shared_ptr<CommandIO> CommandIOPtr;

#endif // COMMANDIO_HPP
