#include "Connection.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/lexical_cast.hpp>
#include <string>

Connection::Connection(boost::shared_ptr<boost::asio::io_service> &_io_service) :
    m_io_service(_io_service),
    m_socket(*_io_service)
{
}

Connection::~Connection()
{
    Disconnect();
}

void
Connection::SplitAddress(const std::string &_address,
                         std::string &_host,
                         std::string &_port)
{
    std::string::size_type _colon = _address.rfind(':');
    if (_colon == std::string::npos || _colon == 0 ||
        _colon + 1 == _address.size())
        throw ConnectError("invalid server address '" + _address +
                           "', expected host:port");

    _host = _address.substr(0, _colon);
    _port = _address.substr(_colon + 1);

    // [::1]:1234
    if (_host.size() > 2 && _host[0] == '[' && _host[_host.size() - 1] == ']')
        _host = _host.substr(1, _host.size() - 2);

    try {
        if (boost::lexical_cast<unsigned short>(_port) == 0)
            throw ConnectError("invalid port in server address '" + _address + "'");
    } catch (const boost::bad_lexical_cast &) {
        throw ConnectError("invalid port in server address '" + _address + "'");
    }
}

void
Connection::Connect(const std::string &_address)
{
    if (m_connected) {
        // disconnect then
        Disconnect();
    }

    std::string _host, _port;
    SplitAddress(_address, _host, _port);

    boost::system::error_code _ec;
    boost::asio::ip::tcp::resolver _r(*m_io_service);
    boost::asio::ip::tcp::resolver::results_type _endpoints =
            _r.resolve(_host, _port, _ec);
    if (_ec)
        throw ConnectError("failed to lookup server " + _address + ": " +
                           _ec.message());

    boost::asio::connect(m_socket, _endpoints, _ec);
    if (_ec)
        throw ConnectError("failed to connect to " + _address + ": " +
                           _ec.message());

    m_connected = true;

    boost::asio::ip::tcp::endpoint _remote = Remote();
    LogInfo("connected to %s:%u", _remote.address().to_string().c_str(),
            static_cast<unsigned>(_remote.port()));
}

void
Connection::Disconnect()
{
    if (!m_connected) return;
    m_connected = false;

    // the peer may have reset the socket already, nothing to report then
    boost::system::error_code _ec;
    m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, _ec);
    m_socket.close(_ec);
    m_read_buffer.consume(m_read_buffer.size());
}

bool
Connection::IsConnected() const
{
    return m_connected;
}

boost::asio::ip::tcp::endpoint
Connection::Remote() const
{
    boost::system::error_code _ec;
    if (m_connected) {
        boost::asio::ip::tcp::endpoint _ep = m_socket.remote_endpoint(_ec);
        if (!_ec) return _ep;
    }
    return boost::asio::ip::tcp::endpoint();
}

void
Connection::Send(const Command &_cmd)
{
    if (!m_connected)
        throw IoError("not connected");

    std::string _line = EncodeCommandLine(_cmd);
    boost::system::error_code _ec;

    // write() returns only after the whole line is handed to the socket
    boost::asio::write(m_socket, boost::asio::buffer(_line), _ec);
    if (_ec)
        throw IoError("write failed: " + _ec.message());
}

std::string
Connection::ReadLine()
{
    if (!m_connected)
        throw IoError("failed to read line: not connected");

    boost::system::error_code _ec;
    std::size_t _bytes = boost::asio::read_until(m_socket, m_read_buffer, '\n', _ec);

    if (_ec == boost::asio::error::eof) {
        // whatever is left before end of stream, maybe nothing
        _bytes = m_read_buffer.size();
    } else if (_ec) {
        throw IoError("failed to read line: " + _ec.message());
    }

    std::string _line(boost::asio::buffers_begin(m_read_buffer.data()),
                      boost::asio::buffers_begin(m_read_buffer.data()) + _bytes);
    m_read_buffer.consume(_bytes);

    while (!_line.empty() &&
           (_line[_line.size() - 1] == '\n' || _line[_line.size() - 1] == '\r'))
        _line.erase(_line.size() - 1);

    return _line;
}

ConnectionPtr
OpenConnection(boost::shared_ptr<boost::asio::io_service> &_io_service,
               const std::string &_address)
{
    ConnectionPtr _connection(new Connection(_io_service));
    _connection->Connect(_address);
    return _connection;
}
