#ifndef BOUNDEDSENDER_HPP
#define BOUNDEDSENDER_HPP

#include "Command.hpp"
#include "CommandIO.hpp"
#include "thread-pool.hpp"

#include <boost/shared_ptr.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/mutex.hpp>
#include <cstddef>

/*!
 * \brief The BoundedSender class sends over a single shared connection
 * with at most a fixed number of sends in flight.
 * Submit takes a slot (waits while every slot is taken) and hands the send
 * to a background thread; that thread locks the connection, sends,
 * unlocks and frees the slot. Socket writes are serialized, the slots
 * only cap how many sends may be queued for the lock.
 */
class BoundedSender {
public:
    /// default in-flight cap
    static const std::size_t DEFAULT_MAX_IN_FLIGHT = 256;
    /// default threads contending for the connection
    static const std::size_t DEFAULT_THREADS = 8;

    /*!
     * \brief BoundedSender constructor
     * \param _io the shared connection
     * \param _max_in_flight max sends submitted but not completed (J)
     * \param _threads background threads performing the sends
     * \throw std::invalid_argument if _io is null, _max_in_flight or _threads is 0
     */
    BoundedSender(CommandIOPtr _io,
                  std::size_t _max_in_flight,
                  std::size_t _threads);

    /// waits for sends in flight if Finish wasn't called
    ~BoundedSender();

    /*!
     * \brief queue a send of _cmd, blocks while _max_in_flight sends are
     * in flight
     * \throw std::logic_error after Finish
     */
    void Submit(const Command &_cmd);

    /*!
     * \brief wait until nothing is in flight, stop the threads
     */
    void Finish();

    /*!
     * \brief canvas size through the shared connection (under its lock)
     * \throw IoError, ProtocolError
     */
    Vec2 QuerySize();

    std::size_t MaxInFlight() const;
    /// highest number of sends in flight seen so far
    std::size_t PeakInFlight() const;

    std::size_t SentCount() const;
    std::size_t FailedCount() const;

protected:
    /// one in-flight send, runs on m_threads
    void _Send(const Command &_cmd);

    /// the shared connection
    CommandIOPtr m_io;
    /// m_io mutex, held for the whole Send
    boost::mutex m_io_mutex;

    /// slots
    std::size_t m_max_in_flight;
    std::size_t m_in_flight = 0;
    std::size_t m_peak_in_flight = 0;
    std::size_t m_sent = 0;
    std::size_t m_failed = 0;
    bool m_finished = false;
    /// guards slots, counters and m_finished
    mutable boost::mutex m_slots_mutex;
    /// signalled whenever a slot frees
    boost::condition_variable m_slot_cv;

    /// threads performing the sends
    ThreadPoolPtr m_threads;

private:
    BoundedSender(BoundedSender const&);
    BoundedSender& operator=(BoundedSender const&);
};

typedef boost::shared_ptr<BoundedSender> BoundedSenderPtr;

#endif // BOUNDEDSENDER_HPP
