#include "BoundedSender.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <boost/bind/bind.hpp>
#include <boost/thread/locks.hpp>
#include <stdexcept>

const std::size_t BoundedSender::DEFAULT_MAX_IN_FLIGHT;
const std::size_t BoundedSender::DEFAULT_THREADS;

BoundedSender::BoundedSender(CommandIOPtr _io,
                             std::size_t _max_in_flight,
                             std::size_t _threads) :
    m_io(_io),
    m_max_in_flight(_max_in_flight)
{
    if (!m_io.get())
        throw std::invalid_argument("bounded sender needs a connection");
    if (!m_max_in_flight)
        throw std::invalid_argument("at least one send must be allowed in flight");
    if (!_threads)
        throw std::invalid_argument("bounded sender needs at least one thread");

    // more threads than slots would never have work
    if (_threads > m_max_in_flight)
        _threads = m_max_in_flight;

    m_threads.reset(new ThreadPool(_threads));
}

BoundedSender::~BoundedSender()
{
    Finish();
}

void
BoundedSender::Submit(const Command &_cmd)
{
    boost::unique_lock<boost::mutex> _l(m_slots_mutex);
    while (m_in_flight >= m_max_in_flight && !m_finished)
        m_slot_cv.wait(_l);

    if (m_finished)
        throw std::logic_error("submit to finished sender");

    ++m_in_flight;
    if (m_in_flight > m_peak_in_flight)
        m_peak_in_flight = m_in_flight;
    _l.unlock();

    m_threads->Post(boost::bind(&BoundedSender::_Send, this, _cmd));
}

void
BoundedSender::_Send(const Command &_cmd)
{
    bool _ok = true;

    {
        boost::unique_lock<boost::mutex> _io_lock(m_io_mutex);
        try {
            m_io->Send(_cmd);
        } catch (const IoError &e) {
            _ok = false;
            LogSendFailure(_cmd, e.what());
        }
    }

    boost::unique_lock<boost::mutex> _l(m_slots_mutex);
    if (_ok)
        ++m_sent;
    else
        ++m_failed;
    --m_in_flight;
    _l.unlock();
    m_slot_cv.notify_all();
}

void
BoundedSender::Finish()
{
    boost::unique_lock<boost::mutex> _l(m_slots_mutex);
    if (m_finished) return;

    while (m_in_flight > 0)
        m_slot_cv.wait(_l);

    m_finished = true;
    _l.unlock();
    m_slot_cv.notify_all();

    m_threads->Join();
}

Vec2
BoundedSender::QuerySize()
{
    boost::unique_lock<boost::mutex> _io_lock(m_io_mutex);
    return m_io->QuerySize();
}

std::size_t
BoundedSender::MaxInFlight() const
{
    return m_max_in_flight;
}

std::size_t
BoundedSender::PeakInFlight() const
{
    boost::unique_lock<boost::mutex> _l(m_slots_mutex);
    return m_peak_in_flight;
}

std::size_t
BoundedSender::SentCount() const
{
    boost::unique_lock<boost::mutex> _l(m_slots_mutex);
    return m_sent;
}

std::size_t
BoundedSender::FailedCount() const
{
    boost::unique_lock<boost::mutex> _l(m_slots_mutex);
    return m_failed;
}
