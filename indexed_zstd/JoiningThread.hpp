#pragma once

#include <thread>
#include <utility>


/**
 * Like std::thread but joins on destruction instead of terminating the program.
 */
class JoiningThread
{
public:
    template<class Function, class... Args>
    explicit
    JoiningThread( Function&& function, Args&&... args ) :
        m_thread( std::forward<Function>( function ), std::forward<Args>( args )... )
    {}

    JoiningThread( JoiningThread&& ) = default;
    JoiningThread( const JoiningThread& ) = delete;
    JoiningThread& operator=( JoiningThread&& ) = delete;
    JoiningThread& operator=( const JoiningThread& ) = delete;

    ~JoiningThread()
    {
        if ( m_thread.joinable() ) {
            m_thread.join();
        }
    }

private:
    std::thread m_thread;
};
