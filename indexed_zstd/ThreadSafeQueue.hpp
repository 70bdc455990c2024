#pragma once

#include <chrono>
#include <cmath>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <utility>


/**
 * A FIFO container with an associated mutex which bundles locking and even waiting accesses.
 */
template<class T>
class ThreadSafeQueue
{
public:
    ThreadSafeQueue() = default;

    void
    push( const T& value )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_queue.emplace( value );
        m_changed.notify_one();
    }

    void
    push( T&& value )
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        m_queue.emplace( std::move( value ) );
        m_changed.notify_one();
    }

    /**
     * @param timeoutSeconds Can be specified to wait until new data arrives from another thread.
     *                       To wait indefinitely specify std::numeric_limits<double>::infinity().
     */
    std::optional<T>
    pop( double timeoutSeconds = 0 )
    {
        if ( std::isnan( timeoutSeconds ) || ( timeoutSeconds < 0. ) ) {
            throw std::invalid_argument( "Time must be a non-negative number!" );
        }

        std::unique_lock<std::mutex> lock( m_mutex );
        if ( timeoutSeconds == std::numeric_limits<double>::infinity() ) {
            m_changed.wait( lock, [this](){ return !m_queue.empty(); } );
        } else {
            const auto timeout = std::chrono::nanoseconds( static_cast<size_t>( timeoutSeconds * 1e9 ) );
            m_changed.wait_for( lock, timeout, [this](){ return !m_queue.empty(); } );
        }

        if ( m_queue.empty() ) {
            return std::nullopt;
        }

        /* Move instead of copy so that move-only values like tasks can be stored. */
        std::optional<T> result( std::move( m_queue.front() ) );
        m_queue.pop();
        return result;
    }

    [[nodiscard]] bool
    empty() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_queue.empty();
    }

    [[nodiscard]] size_t
    size() const
    {
        std::lock_guard<std::mutex> lock( m_mutex );
        return m_queue.size();
    }

private:
    std::queue<T> m_queue;
    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
};
