#ifndef WORKER_HPP
#define WORKER_HPP

#include "Command.hpp"
#include "CommandIO.hpp"

#include <boost/shared_ptr.hpp>
#include <boost/thread/concurrent_queues/sync_bounded_queue.hpp>
#include <boost/thread/mutex.hpp>
#include <cstddef>

/*!
 * \brief The Worker class owns one CommandIO and the queue of commands
 * waiting to be sent on it
 * route:
 *  - somebody runs Run on a background thread
 *  - producers Push commands
 *  - Close, Run drains the queue and returns
 */
class Worker {
public:
    /*!
     * \brief Worker constructor
     * \param _io connection to send commands with
     * \param _capacity max commands waiting in the queue (at least 1)
     */
    Worker(CommandIOPtr _io, std::size_t _capacity);

    /*!
     * \brief enqueue _cmd, blocks the caller while the queue is full
     * \throw std::logic_error after Close
     */
    void Push(const Command &_cmd);

    /*!
     * \brief stop accepting commands, Run returns once the queue is empty
     */
    void Close();

    /*!
     * \brief worker loop: pop and send until closed and drained.
     * a failed send is logged and counted, the loop goes on
     */
    void Run();

    /// commands written successfully
    std::size_t SentCount() const;
    /// commands whose send failed
    std::size_t FailedCount() const;

    /// commands waiting in the queue
    std::size_t Pending() const;
    /// max commands waiting in the queue
    std::size_t Capacity() const;

protected:
    /// connection the commands go to
    CommandIOPtr m_io;
    /// commands waiting to be sent, many producers and this worker
    boost::concurrent::sync_bounded_queue<Command> m_queue;
    /// counters
    std::size_t m_sent = 0;
    std::size_t m_failed = 0;
    /// counters mutex
    mutable boost::mutex m_counters_mutex;

private:
    Worker(Worker const&);
    Worker& operator=(Worker const&);
};

typedef boost::shared_ptr<Worker> WorkerPtr;

#endif // WORKER_HPP
