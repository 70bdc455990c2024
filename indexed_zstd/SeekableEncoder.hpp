#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zstd.h>

#include "Error.hpp"
#include "FileWriter.hpp"
#include "SeekTable.hpp"


struct SeekableEncoderOptions
{
    static constexpr size_t DEFAULT_FRAME_SIZE = 256 * 1024;

    /** Number of uncompressed bytes per frame. Only the last frame may be smaller. */
    size_t frameSize{ DEFAULT_FRAME_SIZE };
    int compressionLevel{ ZSTD_CLEVEL_DEFAULT };
    /** Let zstd append a content checksum to each frame, which is verified when decompressing. */
    bool contentChecksums{ true };
};


/**
 * Writes data as a sequence of independently decodable zstd frames followed by a seek table,
 * so that it can be read back with SeekableDecoder.
 */
class SeekableEncoder
{
public:
    using Options = SeekableEncoderOptions;

    static constexpr size_t DEFAULT_FRAME_SIZE = Options::DEFAULT_FRAME_SIZE;

private:
    struct CompressionContextDeleter
    {
        void
        operator()( ZSTD_CCtx* context ) const
        {
            ZSTD_freeCCtx( context );
        }
    };

public:
    explicit
    SeekableEncoder( std::unique_ptr<FileWriter> output,
                     Options                     options = {} ) :
        m_output( std::move( output ) ),
        m_options( checkOptions( options ) ),
        m_context( ZSTD_createCCtx() )
    {
        if ( !m_output ) {
            throw std::invalid_argument( "May not give invalid pointers as arguments!" );
        }
        if ( !m_context ) {
            throw CodecError( "Failed to create a compression context!" );
        }

        setParameter( ZSTD_c_compressionLevel, m_options.compressionLevel );
        setParameter( ZSTD_c_checksumFlag, m_options.contentChecksums ? 1 : 0 );
        setParameter( ZSTD_c_contentSizeFlag, 1 );

        m_frameBuffer.reserve( m_options.frameSize );
    }

    explicit
    SeekableEncoder( const std::string& filePath,
                     Options            options = {} ) :
        SeekableEncoder( std::make_unique<StandardFileWriter>( filePath ), options )
    {}

    explicit
    SeekableEncoder( std::vector<uint8_t>* output,
                     Options               options = {} ) :
        SeekableEncoder( std::make_unique<VectorFileWriter>( output ), options )
    {}

    SeekableEncoder( const SeekableEncoder& ) = delete;
    SeekableEncoder& operator=( const SeekableEncoder& ) = delete;

    void
    write( const char* data,
           size_t      size )
    {
        if ( m_finished ) {
            throw std::logic_error( "May not write to an encoder which has already been finished!" );
        }

        while ( size > 0 ) {
            const auto nBytesToCopy = std::min( size, m_options.frameSize - m_frameBuffer.size() );
            m_frameBuffer.insert( m_frameBuffer.end(), data, data + nBytesToCopy );
            data += nBytesToCopy;
            size -= nBytesToCopy;

            if ( m_frameBuffer.size() >= m_options.frameSize ) {
                writeFrame();
            }
        }
    }

    void
    write( const std::string& data )
    {
        write( data.data(), data.size() );
    }

    void
    write( const std::vector<uint8_t>& data )
    {
        write( reinterpret_cast<const char*>( data.data() ), data.size() );
    }

    /**
     * Writes the last partial frame and the seek table.
     *
     * @return the total number of bytes written including the seek table.
     */
    size_t
    finish()
    {
        if ( m_finished ) {
            throw std::logic_error( "The encoder has already been finished!" );
        }

        if ( !m_frameBuffer.empty() ) {
            writeFrame();
        }

        const auto seekTable = seekable::SeekTable( m_encodedFrameSizes, m_decodedFrameSizes ).serialize();
        m_output->write( reinterpret_cast<const char*>( seekTable.data() ), seekTable.size() );
        m_output->flush();
        m_encodedBytesWritten += seekTable.size();

        m_finished = true;
        return m_encodedBytesWritten;
    }

    [[nodiscard]] size_t
    frameCount() const noexcept
    {
        return m_encodedFrameSizes.size();
    }

private:
    [[nodiscard]] static Options
    checkOptions( Options options )
    {
        if ( ( options.frameSize == 0 ) || ( options.frameSize > std::numeric_limits<uint32_t>::max() ) ) {
            std::stringstream msg;
            msg << "Frame size must be in [1, " << std::numeric_limits<uint32_t>::max()
                << "] but is " << options.frameSize << "!";
            throw FormatError( msg.str() );
        }

        if ( ( options.compressionLevel < ZSTD_minCLevel() ) || ( options.compressionLevel > ZSTD_maxCLevel() ) ) {
            std::stringstream msg;
            msg << "Compression level must be in [" << ZSTD_minCLevel() << ", " << ZSTD_maxCLevel()
                << "] but is " << options.compressionLevel << "!";
            throw FormatError( msg.str() );
        }

        return options;
    }

    void
    setParameter( ZSTD_cParameter parameter,
                  int             value )
    {
        const auto returnCode = ZSTD_CCtx_setParameter( m_context.get(), parameter, value );
        if ( ZSTD_isError( returnCode ) ) {
            throw CodecError( std::string( "Failed to configure compression: " ) + ZSTD_getErrorName( returnCode ) );
        }
    }

    void
    writeFrame()
    {
        if ( m_encodedFrameSizes.size() >= seekable::MAX_FRAMES ) {
            throw FormatError( "Too many frames! Increase the frame size." );
        }

        m_compressedBuffer.resize( ZSTD_compressBound( m_frameBuffer.size() ) );
        const auto compressedSize = ZSTD_compress2( m_context.get(),
                                                    m_compressedBuffer.data(), m_compressedBuffer.size(),
                                                    m_frameBuffer.data(), m_frameBuffer.size() );
        if ( ZSTD_isError( compressedSize ) ) {
            throw CodecError( std::string( "Compression failed: " ) + ZSTD_getErrorName( compressedSize ) );
        }
        if ( compressedSize > std::numeric_limits<uint32_t>::max() ) {
            throw FormatError( "Compressed frame does not fit into the seek table!" );
        }

        m_output->write( m_compressedBuffer.data(), compressedSize );

        m_encodedFrameSizes.push_back( static_cast<uint32_t>( compressedSize ) );
        m_decodedFrameSizes.push_back( static_cast<uint32_t>( m_frameBuffer.size() ) );
        m_encodedBytesWritten += compressedSize;
        m_frameBuffer.clear();
    }

private:
    const std::unique_ptr<FileWriter> m_output;
    const Options m_options;
    const std::unique_ptr<ZSTD_CCtx, CompressionContextDeleter> m_context;

    std::vector<char> m_frameBuffer;
    std::vector<char> m_compressedBuffer;

    std::vector<uint32_t> m_encodedFrameSizes;
    std::vector<uint32_t> m_decodedFrameSizes;
    size_t m_encodedBytesWritten{ 0 };
    bool m_finished{ false };
};
