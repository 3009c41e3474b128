#ifndef POOLEDSENDER_HPP
#define POOLEDSENDER_HPP

#include "Command.hpp"
#include "CommandIO.hpp"
#include "Worker.hpp"
#include "thread-pool.hpp"

#include <boost/asio.hpp>
#include <boost/random/mersenne_twister.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <cstddef>
#include <string>
#include <vector>

/*!
 * \brief The PooledSender class fans commands out over several connections
 * every connection has its own Worker running on its own thread,
 * Submit hands the command to a uniformly random worker.
 * route:
 *  - construct with connected CommandIOs (or call Connect)
 *  - Submit from any number of threads
 *  - Finish to drain every worker
 */
class PooledSender {
public:
    /// default commands waiting per worker
    static const std::size_t DEFAULT_QUEUE_CAPACITY = 1024;

    /*!
     * \brief PooledSender constructor, starts one worker per connection
     * \param _ios connections, must not be empty
     * \param _queue_capacity max commands waiting per worker
     * \param _seed seed of the worker choice
     * \throw std::invalid_argument if _ios is empty
     */
    PooledSender(const std::vector<CommandIOPtr> &_ios,
                 std::size_t _queue_capacity,
                 unsigned int _seed);

    /// drains the workers if Finish wasn't called
    ~PooledSender();

    /*!
     * \brief open _connections tcp connections to _address
     * \throw ConnectError, nothing is left running then
     */
    static std::vector<CommandIOPtr>
    Connect(boost::shared_ptr<boost::asio::io_service> &_io_service,
            const std::string &_address,
            std::size_t _connections);

    /*!
     * \brief enqueue _cmd on a random worker,
     * blocks the caller while that worker's queue is full
     * \throw std::logic_error after Finish
     */
    void Submit(const Command &_cmd);

    /*!
     * \brief close every queue and wait until the workers sent everything
     */
    void Finish();

    std::size_t WorkerCount() const;
    /// the worker at _index, for inspection
    WorkerPtr GetWorker(std::size_t _index) const;

    std::size_t SentCount() const;
    std::size_t FailedCount() const;

protected:
    /// pick a worker to use to interact with the server
    WorkerPtr _PickWorker();

    /// workers, one per connection
    std::vector<WorkerPtr> m_workers;
    /// threads running the worker loops
    ThreadPoolPtr m_threads;
    /// worker choice
    boost::random::mt19937 m_rng;
    /// m_rng mutex
    boost::mutex m_rng_mutex;
    /// set by Finish
    bool m_finished = false;
    /// m_finished flag mutex
    boost::mutex m_finished_mutex;

private:
    PooledSender(PooledSender const&);
    PooledSender& operator=(PooledSender const&);
};

typedef boost::shared_ptr<PooledSender> PooledSenderPtr;

#endif // POOLEDSENDER_HPP
