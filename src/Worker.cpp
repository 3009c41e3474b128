#include "Worker.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/thread/locks.hpp>
#include <stdexcept>

Worker::Worker(CommandIOPtr _io, std::size_t _capacity) :
    m_io(_io),
    m_queue(_capacity ? _capacity : 1)
{
}

void
Worker::Push(const Command &_cmd)
{
    try {
        m_queue.push_back(_cmd);
    } catch (const boost::concurrent::sync_queue_is_closed &) {
        throw std::logic_error("push to closed worker queue");
    }
}

void
Worker::Close()
{
    m_queue.close();
}

void
Worker::Run()
{
    Command _cmd;

    // closed status comes only once the queue is drained
    while (m_queue.wait_pull_front(_cmd) == boost::concurrent::queue_op_status::success) {
        try {
            m_io->Send(_cmd);
        } catch (const IoError &e) {
            LogSendFailure(_cmd, e.what());
            boost::unique_lock<boost::mutex> _scoped(m_counters_mutex);
            ++m_failed;
            continue;
        }

        boost::unique_lock<boost::mutex> _scoped(m_counters_mutex);
        ++m_sent;
    }
}

std::size_t
Worker::SentCount() const
{
    boost::unique_lock<boost::mutex> _scoped(m_counters_mutex);
    return m_sent;
}

std::size_t
Worker::FailedCount() const
{
    boost::unique_lock<boost::mutex> _scoped(m_counters_mutex);
    return m_failed;
}

std::size_t
Worker::Pending() const
{
    return m_queue.size();
}

std::size_t
Worker::Capacity() const
{
    return m_queue.capacity();
}
