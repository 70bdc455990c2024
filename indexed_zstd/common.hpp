#pragma once

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>


template<typename I1,
         typename I2,
         typename Enable = typename std::enable_if<
            std::is_integral<I1>::value &&
            std::is_integral<I2>::value
         >::type>
I1
ceilDiv( I1 dividend,
         I2 divisor )
{
    return ( dividend + divisor - 1 ) / divisor;
}


template<typename S, typename T>
std::ostream&
operator<<( std::ostream&  out,
            std::pair<S,T> pair )
{
    out << "(" << pair.first << "," << pair.second << ")";
    return out;
}


inline std::chrono::time_point<std::chrono::high_resolution_clock>
now()
{
    return std::chrono::high_resolution_clock::now();
}


/**
 * @return duration in seconds
 */
template<typename T0, typename T1>
double
duration( const T0& t0,
          const T1& t1 )
{
    return std::chrono::duration<double>( t1 - t0 ).count();
}


/**
 * Collects a whole log line so that it can be written to std::cerr with a single call.
 * Messages from different worker threads will therefore not be interleaved.
 * Arguments are separated by spaces and the line is prefixed with a time stamp and the thread ID.
 */
class ThreadSafeOutput
{
public:
    ThreadSafeOutput()
    {
        const auto time = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch() ).count();
        m_out << "[" << std::setw( 6 ) << ( time / 1000 ) % 1000000 << "."
              << std::setw( 3 ) << std::setfill( '0' ) << time % 1000 << std::setfill( ' ' )
              << " ms][thread " << std::this_thread::get_id() << "]";
    }

    template<typename T>
    ThreadSafeOutput&
    operator<<( const T& value )
    {
        m_out << " " << value;
        return *this;
    }

    [[nodiscard]] std::string
    str() const
    {
        return m_out.str() + "\n";
    }

private:
    std::stringstream m_out;
};


/**
 * @return true if a + b would not fit into the result type.
 */
template<typename T>
[[nodiscard]] constexpr bool
additionOverflows( T a,
                   T b )
{
    static_assert( std::is_unsigned<T>::value, "Only implemented for unsigned types!" );
    return a > std::numeric_limits<T>::max() - b;
}
