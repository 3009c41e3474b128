#ifndef CONNECTION_HPP
#define CONNECTION_HPP

#include "CommandIO.hpp"

#include <boost/asio.hpp>
#include <boost/shared_ptr.hpp>
#include <string>

/*!
 * \brief The Connection class is tcp implementation of CommandIO
 * route:
 *  - connect (call to Connect)
 *  - exchange lines (Send / ReadLine / QuerySize)
 *  - disconnect (explicitly or on destruction)
 * all socket operations are synchronous, the calling thread blocks
 */
class Connection : public CommandIO {
public:
    /*!
     * \brief Connection constructor
     * \param _io_service io_service the socket belongs to
     */
    explicit Connection(boost::shared_ptr<boost::asio::io_service> &_io_service);

    ~Connection();

    /*!
     * \brief resolve and connect
     * \param _address "host:port", host may be a name, an ipv4 address
     * or a bracketed ipv6 address
     * \throw ConnectError
     */
    void Connect(const std::string &_address);

    /*!
     * \brief disconnects (shutdown and close the socket)
     */
    void Disconnect();

    /*!
     * \brief IsConnected
     * \return true if connected, false otherwise
     */
    bool IsConnected() const;

    void Send(const Command &_cmd);

    std::string ReadLine();

    /*!
     * \brief remote endpoint, default constructed if not connected
     */
    boost::asio::ip::tcp::endpoint Remote() const;

    /*!
     * \brief split "host:port"
     * \throw ConnectError if there's no port or it is not a number
     */
    static void SplitAddress(const std::string &_address,
                             std::string &_host,
                             std::string &_port);

protected:
    /// io_service
    boost::shared_ptr<boost::asio::io_service> m_io_service;
    /// socket to send and receive data with
    boost::asio::ip::tcp::socket m_socket;
    /// bytes read past the last returned line
    boost::asio::streambuf m_read_buffer;
    /// flags if is in connected or not
    bool m_connected = false;

private:
    // socket ownership is unique
    Connection(Connection const&);
    Connection& operator=(Connection const&);
};

/// connection pointer
typedef boost::shared_ptr<Connection> ConnectionPtr;

/*!
 * \brief create and connect a Connection
 * \throw ConnectError
 */
ConnectionPtr OpenConnection(boost::shared_ptr<boost::asio::io_service> &_io_service,
                             const std::string &_address);

#endif // CONNECTION_HPP
