#pragma once

#include <stdint.h>
#include <stdio.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "Error.hpp"


/**
 * Sink for the encoder. Only appending is supported.
 */
class FileWriter
{
public:
    virtual ~FileWriter() = default;

    virtual void
    write( const char* buffer,
           size_t      size ) = 0;

    virtual void
    flush()
    {}
};


class StandardFileWriter :
    public FileWriter
{
public:
    explicit
    StandardFileWriter( std::string filePath ) :
        m_filePath( std::move( filePath ) ),
        m_file( std::fopen( m_filePath.c_str(), "wb" ) )
    {
        if ( m_file == nullptr ) {
            std::stringstream msg;
            msg << "Opening file '" << m_filePath << "' for writing failed: " << std::strerror( errno );
            throw IoError( msg.str() );
        }
    }

    /**
     * Writes to standard output without closing it on destruction.
     */
    explicit
    StandardFileWriter( FILE* file ) :
        m_filePath( "<stream>" ),
        m_file( file ),
        m_ownsFile( false )
    {
        if ( m_file == nullptr ) {
            throw std::invalid_argument( "May not give invalid pointers as arguments!" );
        }
    }

    ~StandardFileWriter() override
    {
        if ( m_ownsFile && ( m_file != nullptr ) ) {
            std::fclose( m_file );
        }
    }

    StandardFileWriter( const StandardFileWriter& ) = delete;
    StandardFileWriter& operator=( const StandardFileWriter& ) = delete;

    void
    write( const char* buffer,
           size_t      size ) override
    {
        if ( std::fwrite( buffer, 1, size, m_file ) != size ) {
            std::stringstream msg;
            msg << "Failed to write " << size << " B to '" << m_filePath << "': " << std::strerror( errno );
            throw IoError( msg.str() );
        }
    }

    void
    flush() override
    {
        if ( std::fflush( m_file ) != 0 ) {
            throw IoError( "Failed to flush '" + m_filePath + "': " + std::strerror( errno ) );
        }
    }

private:
    const std::string m_filePath;
    FILE* const m_file;
    const bool m_ownsFile{ true };
};


class VectorFileWriter :
    public FileWriter
{
public:
    explicit
    VectorFileWriter( std::vector<uint8_t>* output ) :
        m_output( output )
    {
        if ( m_output == nullptr ) {
            throw std::invalid_argument( "May not give invalid pointers as arguments!" );
        }
    }

    void
    write( const char* buffer,
           size_t      size ) override
    {
        const auto* const bytes = reinterpret_cast<const uint8_t*>( buffer );
        m_output->insert( m_output->end(), bytes, bytes + size );
    }

private:
    std::vector<uint8_t>* const m_output;
};
