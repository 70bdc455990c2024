#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>


enum class ErrorCode : uint8_t
{
    /** The source could not be opened or read. */
    IO,
    /** The compressed stream or its seek table is broken, or zstd rejected an operation. */
    CODEC,
    /** Invalid caller-supplied ranges or offset arithmetic which does not fit into the host integers. */
    FORMAT,
    /** The reader has been closed explicitly. */
    CLOSED,
};


[[nodiscard]] inline const char*
toString( ErrorCode errorCode )
{
    switch ( errorCode )
    {
    case ErrorCode::IO:     return "IO";
    case ErrorCode::CODEC:  return "Codec";
    case ErrorCode::FORMAT: return "Format";
    case ErrorCode::CLOSED: return "Closed";
    }
    return "Unknown";
}


/**
 * Common base for all errors reported by the readers and decoders so that callers
 * can catch a single type and still distinguish the cause using @ref code.
 */
class SeekableError :
    public std::runtime_error
{
public:
    SeekableError( ErrorCode          code,
                   const std::string& message ) :
        std::runtime_error( message ),
        m_code( code )
    {}

    [[nodiscard]] ErrorCode
    code() const noexcept
    {
        return m_code;
    }

private:
    ErrorCode m_code;
};


class IoError :
    public SeekableError
{
public:
    explicit
    IoError( const std::string& message ) :
        SeekableError( ErrorCode::IO, "IO error: " + message )
    {}
};


class CodecError :
    public SeekableError
{
public:
    explicit
    CodecError( const std::string& message ) :
        SeekableError( ErrorCode::CODEC, "Zstd error: " + message )
    {}
};


class FormatError :
    public SeekableError
{
public:
    explicit
    FormatError( const std::string& message ) :
        SeekableError( ErrorCode::FORMAT, "Seekable format error: " + message )
    {}
};


class ClosedError :
    public SeekableError
{
public:
    ClosedError() :
        SeekableError( ErrorCode::CLOSED, "Reader is closed" )
    {}
};
