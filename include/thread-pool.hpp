#ifndef THREADPOOL_HPP
#define THREADPOOL_HPP

#include <cstddef>
#include <boost/thread.hpp>
#include <boost/asio/io_service.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/function.hpp>
#include <boost/bind/bind.hpp>

/*
 * thread pool class.
 * jobs posted to the pool are picked up by its threads in posting order,
 * Join waits for every posted job to finish.
 */

class ThreadPool {
public:
    // typedef for typing purposes
    typedef boost::shared_ptr<boost::asio::io_service> IoServicePtr;
    typedef boost::shared_ptr<boost::thread_group> WorkerThreadGroupPtr;
    typedef boost::shared_ptr<boost::asio::io_service::work> WorkerPtr;

    /*
     * construct a thread pool with _threads_count threads
     */
    explicit ThreadPool(std::size_t _threads_count = 1,
                        IoServicePtr _io_service = IoServicePtr()) :
        m_threads_count(_threads_count),
        m_io_service(_io_service),
        m_thread_group(new boost::thread_group),
        m_io_service_guard(WorkerPtr())
    {
        if (!m_threads_count)
            m_threads_count = 1;
        if (!m_io_service.get())
            m_io_service.reset(new boost::asio::io_service);
        m_io_service_guard.reset(new boost::asio::io_service::work(*m_io_service));

        for (std::size_t i = 0; i < m_threads_count; ++i) {
            m_thread_group->create_thread(boost::bind(&ThreadPool::_Run,
                                                      m_io_service));
        }
    }

    ~ThreadPool()
    {
        Join();
    }

    /*
     * put a job _job to pool
     * jobs must not throw
     */
    void Post(boost::function<void()> _job)
    {
        m_io_service->post(_job);
    }

    /*
     * let the threads exit once every posted job is done and wait for them.
     * no job may be posted after Join
     */
    void Join()
    {
        boost::unique_lock<boost::mutex> _scoped(m_join_mutex);
        if (m_joined) return;
        m_joined = true;

        // remove the io_service guard worker
        m_io_service_guard.reset();
        // wait untill all threads end
        m_thread_group->join_all();
    }

    /*
     * get threads count
     */
    std::size_t ThreadCount(void) const
    {
        return m_threads_count;
    }
protected:
    static void _Run(IoServicePtr _io_service)
    {
        _io_service->run();
    }

    // threads count
    std::size_t m_threads_count;
    // io_service for thread group
    IoServicePtr m_io_service;
    // thread group
    WorkerThreadGroupPtr m_thread_group;
    // sentinel for io_service not to shutdown when we don't have any active threads
    WorkerPtr m_io_service_guard;
    // whether threads are joined already
    bool m_joined = false;
    // m_joined flag mutex
    boost::mutex m_join_mutex;

private:
    // we won't let anybody a copy of thread pool
    ThreadPool(ThreadPool const&);
    ThreadPool& operator=(ThreadPool const&);
};

typedef boost::shared_ptr<ThreadPool> ThreadPoolPtr;

#endif // THREADPOOL_HPP
