#include "PooledSender.hpp"
#include "Connection.hpp"

#include <boost/bind/bind.hpp>
#include <boost/random/uniform_int_distribution.hpp>
#include <boost/thread/locks.hpp>
#include <stdexcept>

const std::size_t PooledSender::DEFAULT_QUEUE_CAPACITY;

PooledSender::PooledSender(const std::vector<CommandIOPtr> &_ios,
                           std::size_t _queue_capacity,
                           unsigned int _seed) :
    m_rng(_seed)
{
    if (_ios.empty())
        throw std::invalid_argument("you must spawn at least one socket");

    for (std::size_t i = 0; i < _ios.size(); ++i)
        m_workers.push_back(WorkerPtr(new Worker(_ios[i], _queue_capacity)));

    // a worker loop occupies its thread until Finish
    m_threads.reset(new ThreadPool(m_workers.size()));
    for (std::size_t i = 0; i < m_workers.size(); ++i)
        m_threads->Post(boost::bind(&Worker::Run, m_workers[i]));
}

PooledSender::~PooledSender()
{
    Finish();
}

std::vector<CommandIOPtr>
PooledSender::Connect(boost::shared_ptr<boost::asio::io_service> &_io_service,
                      const std::string &_address,
                      std::size_t _connections)
{
    std::vector<CommandIOPtr> _ios;

    // a ConnectError unwinds _ios, closing what was opened so far
    for (std::size_t i = 0; i < _connections; ++i)
        _ios.push_back(OpenConnection(_io_service, _address));

    return _ios;
}

WorkerPtr
PooledSender::_PickWorker()
{
    boost::random::uniform_int_distribution<std::size_t> _dist(0, m_workers.size() - 1);
    boost::unique_lock<boost::mutex> _scoped(m_rng_mutex);
    return m_workers[_dist(m_rng)];
}

void
PooledSender::Submit(const Command &_cmd)
{
    {
        boost::unique_lock<boost::mutex> _scoped(m_finished_mutex);
        if (m_finished)
            throw std::logic_error("submit to finished sender");
    }

    _PickWorker()->Push(_cmd);
}

void
PooledSender::Finish()
{
    boost::unique_lock<boost::mutex> _scoped(m_finished_mutex);
    if (m_finished) return;
    m_finished = true;
    _scoped.unlock();

    for (std::size_t i = 0; i < m_workers.size(); ++i)
        m_workers[i]->Close();

    m_threads->Join();
}

std::size_t
PooledSender::WorkerCount() const
{
    return m_workers.size();
}

WorkerPtr
PooledSender::GetWorker(std::size_t _index) const
{
    return m_workers.at(_index);
}

std::size_t
PooledSender::SentCount() const
{
    std::size_t _sent = 0;
    for (std::size_t i = 0; i < m_workers.size(); ++i)
        _sent += m_workers[i]->SentCount();
    return _sent;
}

std::size_t
PooledSender::FailedCount() const
{
    std::size_t _failed = 0;
    for (std::size_t i = 0; i < m_workers.size(); ++i)
        _failed += m_workers[i]->FailedCount();
    return _failed;
}
