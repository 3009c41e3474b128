#include "Dispatcher.hpp"
#include "Connection.hpp"

#include <stdexcept>
#include <vector>

DispatchConfig
DefaultDispatchConfig()
{
    DispatchConfig _config;
    _config.mode = POOLED_DISPATCH;
    _config.connections = 4;
    _config.queue_capacity = PooledSender::DEFAULT_QUEUE_CAPACITY;
    _config.max_in_flight = BoundedSender::DEFAULT_MAX_IN_FLIGHT;
    _config.threads = BoundedSender::DEFAULT_THREADS;
    _config.seed = 5489u;
    return _config;
}

bool
ParseDispatchMode(const std::string &_name, DispatchMode &_mode)
{
    if (_name == "pooled") {
        _mode = POOLED_DISPATCH;
        return true;
    }
    if (_name == "bounded") {
        _mode = BOUNDED_DISPATCH;
        return true;
    }
    return false;
}

const char *
DispatchModeName(DispatchMode _mode)
{
    switch (_mode) {
    case POOLED_DISPATCH:
        return "pooled";
    case BOUNDED_DISPATCH:
        return "bounded";
    }
    return "unknown";
}

Dispatcher::Dispatcher(PooledSenderPtr _pooled, CommandIOPtr _control) :
    m_mode(POOLED_DISPATCH),
    m_pooled(_pooled),
    m_control(_control)
{
    if (!m_pooled.get() || !m_control.get())
        throw std::invalid_argument("pooled dispatcher needs a sender and a control connection");
}

Dispatcher::Dispatcher(BoundedSenderPtr _bounded) :
    m_mode(BOUNDED_DISPATCH),
    m_bounded(_bounded)
{
    if (!m_bounded.get())
        throw std::invalid_argument("bounded dispatcher needs a sender");
}

DispatcherPtr
Dispatcher::Connect(boost::shared_ptr<boost::asio::io_service> &_io_service,
                    const DispatchConfig &_config)
{
    switch (_config.mode) {
    case POOLED_DISPATCH: {
        CommandIOPtr _control = OpenConnection(_io_service, _config.address);
        std::vector<CommandIOPtr> _ios =
                PooledSender::Connect(_io_service, _config.address, _config.connections);
        PooledSenderPtr _pooled(new PooledSender(_ios,
                                                 _config.queue_capacity,
                                                 _config.seed));
        return DispatcherPtr(new Dispatcher(_pooled, _control));
    }
    case BOUNDED_DISPATCH: {
        CommandIOPtr _io = OpenConnection(_io_service, _config.address);
        BoundedSenderPtr _bounded(new BoundedSender(_io,
                                                    _config.max_in_flight,
                                                    _config.threads));
        return DispatcherPtr(new Dispatcher(_bounded));
    }
    }

    throw std::invalid_argument("unknown dispatch mode");
}

DispatchMode
Dispatcher::Mode() const
{
    return m_mode;
}

Vec2
Dispatcher::QuerySize()
{
    switch (m_mode) {
    case POOLED_DISPATCH:
        return m_control->QuerySize();
    case BOUNDED_DISPATCH:
        return m_bounded->QuerySize();
    }
    throw std::logic_error("unknown dispatch mode");
}

void
Dispatcher::Submit(const Command &_cmd)
{
    switch (m_mode) {
    case POOLED_DISPATCH:
        m_pooled->Submit(_cmd);
        break;
    case BOUNDED_DISPATCH:
        m_bounded->Submit(_cmd);
        break;
    }
}

void
Dispatcher::Finish()
{
    switch (m_mode) {
    case POOLED_DISPATCH:
        m_pooled->Finish();
        break;
    case BOUNDED_DISPATCH:
        m_bounded->Finish();
        break;
    }
}

std::size_t
Dispatcher::SentCount() const
{
    switch (m_mode) {
    case POOLED_DISPATCH:
        return m_pooled->SentCount();
    case BOUNDED_DISPATCH:
        return m_bounded->SentCount();
    }
    return 0;
}

std::size_t
Dispatcher::FailedCount() const
{
    switch (m_mode) {
    case POOLED_DISPATCH:
        return m_pooled->FailedCount();
    case BOUNDED_DISPATCH:
        return m_bounded->FailedCount();
    }
    return 0;
}

std::size_t
Dispatcher::ConnectionCount() const
{
    switch (m_mode) {
    case POOLED_DISPATCH:
        return m_pooled->WorkerCount();
    case BOUNDED_DISPATCH:
        return 1;
    }
    return 0;
}
