#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "JoiningThread.hpp"
#include "ThreadSafeQueue.hpp"


/**
 * Function evaluations can be given to a ThreadPool instance, which assigns them to a free thread.
 * Exceptions thrown by the tasks are stored in and rethrown by the returned futures.
 * On destruction, all already submitted tasks are still evaluated before the threads are joined.
 */
class ThreadPool
{
private:
    /** An empty function is the signal for a worker to quit. */
    using Task = std::function<void()>;

public:
    explicit
    ThreadPool( size_t nThreads = std::thread::hardware_concurrency() )
    {
        if ( nThreads == 0 ) {
            nThreads = std::max<size_t>( 1, std::thread::hardware_concurrency() );
        }

        m_threads.reserve( nThreads );
        for ( size_t i = 0; i < nThreads; ++i ) {
            m_threads.emplace_back( &ThreadPool::workerMain, this );
        }
    }

    ~ThreadPool()
    {
        for ( size_t i = 0; i < m_threads.size(); ++i ) {
            m_tasks.push( Task() );
        }
        m_threads.clear();
    }

    ThreadPool( const ThreadPool& ) = delete;
    ThreadPool& operator=( const ThreadPool& ) = delete;

    template<class Functor,
             typename Result = std::invoke_result_t<std::decay_t<Functor> > >
    [[nodiscard]] std::future<Result>
    submitTask( Functor&& task )
    {
        /* std::function requires copyable callables, which std::packaged_task is not. */
        auto packagedTask = std::make_shared<std::packaged_task<Result()> >( std::forward<Functor>( task ) );
        auto resultFuture = packagedTask->get_future();
        m_tasks.push( [packagedTask = std::move( packagedTask )] () { ( *packagedTask )(); } );
        return resultFuture;
    }

    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_threads.size();
    }

private:
    void
    workerMain()
    {
        while ( true ) {
            auto task = m_tasks.pop( std::numeric_limits<double>::infinity() );
            if ( !task || !*task ) {
                break;
            }
            ( *task )();
        }
    }

private:
    ThreadSafeQueue<Task> m_tasks;
    std::vector<JoiningThread> m_threads;
};
