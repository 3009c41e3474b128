#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "BoundedSender.hpp"
#include "Command.hpp"
#include "CommandIO.hpp"
#include "PooledSender.hpp"

#include <boost/asio.hpp>
#include <boost/shared_ptr.hpp>
#include <cstddef>
#include <string>

/// dispatch strategies
typedef enum _DispatchMode {
    POOLED_DISPATCH = 0,    /// one worker and one connection per pool slot
    BOUNDED_DISPATCH        /// one shared connection, capped sends in flight
} DispatchMode;

/// everything needed to connect a Dispatcher
typedef struct _DispatchConfig {
    DispatchMode mode;
    /// host:port
    std::string address;
    /// pooled: worker connections
    std::size_t connections;
    /// pooled: max commands waiting per worker
    std::size_t queue_capacity;
    /// bounded: max sends in flight
    std::size_t max_in_flight;
    /// bounded: threads contending for the connection
    std::size_t threads;
    /// pooled: seed of the worker choice
    unsigned int seed;
} DispatchConfig;

/// defaults: pooled, 4 connections, 1024 capacity, 256 in flight
DispatchConfig DefaultDispatchConfig();

/// "pooled" / "bounded", false on anything else
bool ParseDispatchMode(const std::string &_name, DispatchMode &_mode);
const char *DispatchModeName(DispatchMode _mode);

/*!
 * \brief The Dispatcher class is the single entry point painting goes
 * through, whichever strategy was configured.
 * route:
 *  - Connect (or construct from an already built sender)
 *  - QuerySize once
 *  - Submit every command, Finish
 */
class Dispatcher {
public:
    /*!
     * \brief pooled dispatcher
     * \param _pooled sender owning the worker connections
     * \param _control reserved connection answering QuerySize,
     * never used for painting
     */
    Dispatcher(PooledSenderPtr _pooled, CommandIOPtr _control);

    /*!
     * \brief bounded dispatcher, QuerySize goes through the shared connection
     */
    explicit Dispatcher(BoundedSenderPtr _bounded);

    /*!
     * \brief open the connections _config asks for
     * \throw ConnectError, nothing is left connected then
     */
    static boost::shared_ptr<Dispatcher>
    Connect(boost::shared_ptr<boost::asio::io_service> &_io_service,
            const DispatchConfig &_config);

    DispatchMode Mode() const;

    /*!
     * \brief canvas size
     * \throw IoError, ProtocolError
     */
    Vec2 QuerySize();

    /*!
     * \brief hand _cmd to the strategy, blocks while it applies backpressure
     */
    void Submit(const Command &_cmd);

    /*!
     * \brief wait until every submitted command went out (or failed)
     */
    void Finish();

    std::size_t SentCount() const;
    std::size_t FailedCount() const;

    /// number of connections painting
    std::size_t ConnectionCount() const;

protected:
    /// which of the senders below is set
    DispatchMode m_mode;
    /// POOLED_DISPATCH
    PooledSenderPtr m_pooled;
    CommandIOPtr m_control;
    /// BOUNDED_DISPATCH
    BoundedSenderPtr m_bounded;

private:
    Dispatcher(Dispatcher const&);
    Dispatcher& operator=(Dispatcher const&);
};

typedef boost::shared_ptr<Dispatcher> DispatcherPtr;

#endif // DISPATCHER_HPP
