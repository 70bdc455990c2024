#pragma once

#include <stdint.h>
#include <stdio.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

#include "Error.hpp"


/**
 * Byte-granular random access source for compressed archives.
 * All sources must be seekable because the seek table is stored at the end of the archive.
 */
class FileReader
{
public:
    virtual ~FileReader() = default;

    /**
     * Opens an independent handle to the same data. The new reader has its own position,
     * so that it can be used from another thread without any locking.
     */
    [[nodiscard]] virtual std::unique_ptr<FileReader>
    clone() const = 0;

    virtual void
    close() = 0;

    [[nodiscard]] virtual bool
    closed() const = 0;

    /**
     * @return the number of bytes read, which is only smaller than @p nBytesToRead at the end of the file.
     */
    [[nodiscard]] virtual size_t
    read( char*  buffer,
          size_t nBytesToRead ) = 0;

    /**
     * Moves to the absolute byte @p offset. Offsets after the end are allowed and only make reads return nothing.
     */
    virtual void
    seek( size_t offset ) = 0;

    [[nodiscard]] virtual size_t
    size() const = 0;

    /**
     * Seeks to @p offset and reads exactly @p nBytesToRead bytes or throws.
     */
    void
    readExactly( size_t offset,
                 char*  buffer,
                 size_t nBytesToRead )
    {
        seek( offset );
        const auto nBytesRead = read( buffer, nBytesToRead );
        if ( nBytesRead != nBytesToRead ) {
            std::stringstream msg;
            msg << "Could only read " << nBytesRead << " B instead of " << nBytesToRead
                << " B at offset " << offset << "!";
            throw IoError( msg.str() );
        }
    }
};


using UniqueFileReader = std::unique_ptr<FileReader>;


class StandardFileReader :
    public FileReader
{
public:
    explicit
    StandardFileReader( std::string filePath ) :
        m_filePath( std::move( filePath ) ),
        m_file( throwingOpen( m_filePath, "rb" ) ),
        m_fileSizeBytes( determineFileSize( ::fileno( m_file ) ) )
    {}

    ~StandardFileReader() override
    {
        if ( m_file != nullptr ) {
            std::fclose( m_file );
        }
    }

    StandardFileReader( const StandardFileReader& ) = delete;
    StandardFileReader& operator=( const StandardFileReader& ) = delete;

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        if ( closed() ) {
            throw IoError( "Cannot reopen a closed file!" );
        }
        /* Calling fopen twice on the same path yields independent file positions. Sharing m_file would not. */
        return std::make_unique<StandardFileReader>( m_filePath );
    }

    void
    close() override
    {
        if ( m_file != nullptr ) {
            std::fclose( m_file );
            m_file = nullptr;
        }
    }

    [[nodiscard]] bool
    closed() const override
    {
        return m_file == nullptr;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nBytesToRead ) override
    {
        if ( m_file == nullptr ) {
            throw IoError( "The file '" + m_filePath + "' is not open!" );
        }

        const auto nBytesRead = std::fread( buffer, 1, nBytesToRead, m_file );
        if ( ( nBytesRead < nBytesToRead ) && ( std::ferror( m_file ) != 0 ) ) {
            std::stringstream msg;
            msg << "Failed to read from '" << m_filePath << "': " << std::strerror( errno );
            throw IoError( msg.str() );
        }
        return nBytesRead;
    }

    void
    seek( size_t offset ) override
    {
        if ( m_file == nullptr ) {
            throw IoError( "The file '" + m_filePath + "' is not open!" );
        }

        if ( ( offset > static_cast<size_t>( std::numeric_limits<long int>::max() ) )
             || ( std::fseek( m_file, static_cast<long int>( offset ), SEEK_SET ) != 0 ) ) {
            std::stringstream msg;
            msg << "Could not seek to byte " << offset << " in '" << m_filePath << "': " << std::strerror( errno );
            throw IoError( msg.str() );
        }
    }

    [[nodiscard]] size_t
    size() const override
    {
        return m_fileSizeBytes;
    }

private:
    [[nodiscard]] static FILE*
    throwingOpen( const std::string& filePath,
                  const char*        mode )
    {
        auto* const file = std::fopen( filePath.c_str(), mode );
        if ( file == nullptr ) {
            std::stringstream msg;
            msg << "Opening file '" << filePath << "' with mode '" << mode << "' failed: " << std::strerror( errno );
            throw IoError( msg.str() );
        }

        struct stat fileStats;
        if ( ( fstat( ::fileno( file ), &fileStats ) != 0 ) || S_ISFIFO( fileStats.st_mode ) ) {
            std::fclose( file );
            throw IoError( "The file '" + filePath + "' is not seekable!" );
        }

        return file;
    }

    [[nodiscard]] static size_t
    determineFileSize( int fileNumber )
    {
        struct stat fileStats;
        if ( fstat( fileNumber, &fileStats ) != 0 ) {
            throw IoError( std::string( "Could not determine the file size: " ) + std::strerror( errno ) );
        }
        return fileStats.st_size;
    }

private:
    const std::string m_filePath;
    FILE* m_file{ nullptr };
    const size_t m_fileSizeBytes;
};


/**
 * Reads from an immutable in-memory archive. Clones share the data but not the position.
 */
class SharedBufferFileReader :
    public FileReader
{
public:
    using Buffer = std::shared_ptr<const std::vector<uint8_t> >;

public:
    explicit
    SharedBufferFileReader( Buffer buffer ) :
        m_buffer( std::move( buffer ) )
    {
        if ( !m_buffer ) {
            throw std::invalid_argument( "May not give invalid pointers as arguments!" );
        }
    }

    explicit
    SharedBufferFileReader( std::vector<uint8_t> buffer ) :
        m_buffer( std::make_shared<const std::vector<uint8_t> >( std::move( buffer ) ) )
    {}

    [[nodiscard]] UniqueFileReader
    clone() const override
    {
        if ( closed() ) {
            throw IoError( "Cannot reopen a closed buffer!" );
        }
        return std::make_unique<SharedBufferFileReader>( m_buffer );
    }

    void
    close() override
    {
        m_buffer.reset();
        m_position = 0;
    }

    [[nodiscard]] bool
    closed() const override
    {
        return !m_buffer;
    }

    [[nodiscard]] size_t
    read( char*  buffer,
          size_t nBytesToRead ) override
    {
        if ( !m_buffer ) {
            throw IoError( "The buffer has been closed!" );
        }

        const auto nBytesRead = std::min( nBytesToRead, size() - std::min( m_position, size() ) );
        if ( nBytesRead > 0 ) {
            std::memcpy( buffer, m_buffer->data() + m_position, nBytesRead );
        }
        m_position += nBytesRead;
        return nBytesRead;
    }

    void
    seek( size_t offset ) override
    {
        if ( !m_buffer ) {
            throw IoError( "The buffer has been closed!" );
        }
        m_position = offset;
    }

    [[nodiscard]] size_t
    size() const override
    {
        return m_buffer ? m_buffer->size() : 0;
    }

private:
    Buffer m_buffer;
    size_t m_position{ 0 };
};
