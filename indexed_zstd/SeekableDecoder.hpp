#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zstd.h>

#include "Error.hpp"
#include "FileReader.hpp"
#include "SeekTable.hpp"


/**
 * Decode cursor over a seekable zstd archive. Decompression can be restricted to an inclusive
 * range of frames and is then driven incrementally with @ref decompress.
 *
 * @note The cursor state is not thread-safe. Use one instance per thread, e.g., by creating
 *       each instance with a clone of the same FileReader.
 */
class SeekableDecoder
{
public:
    /**
     * Must be a power of two and should be at least the block size of the underlying device.
     * Smaller frames are read with a single call.
     */
    static constexpr size_t IOBUF_SIZE = 128 * 1024;

private:
    struct DecompressionContextDeleter
    {
        void
        operator()( ZSTD_DCtx* context ) const
        {
            ZSTD_freeDCtx( context );
        }
    };

    using UniqueDecompressionContext = std::unique_ptr<ZSTD_DCtx, DecompressionContextDeleter>;

public:
    explicit
    SeekableDecoder( UniqueFileReader file ) :
        m_file( std::move( file ) ),
        m_seekTable( readSeekTableFrom( m_file.get() ) ),
        m_context( createContext() )
    {
        if ( frameCount() > 0 ) {
            setDecodeWindow( 0, frameCount() - 1 );
        }
    }

    explicit
    SeekableDecoder( const std::string& filePath ) :
        SeekableDecoder( std::make_unique<StandardFileReader>( filePath ) )
    {}

    SeekableDecoder( const SeekableDecoder& ) = delete;
    SeekableDecoder& operator=( const SeekableDecoder& ) = delete;

    SeekableDecoder( SeekableDecoder&& ) = default;
    SeekableDecoder& operator=( SeekableDecoder&& ) = default;

    [[nodiscard]] const seekable::SeekTable&
    seekTable() const noexcept
    {
        return m_seekTable;
    }

    [[nodiscard]] size_t
    frameCount() const noexcept
    {
        return m_seekTable.frameCount();
    }

    [[nodiscard]] size_t
    frameStartDecompressed( size_t frameIndex ) const
    {
        return m_seekTable.frameStartDecompressed( frameIndex );
    }

    [[nodiscard]] size_t
    frameEndDecompressed( size_t frameIndex ) const
    {
        return m_seekTable.frameEndDecompressed( frameIndex );
    }

    [[nodiscard]] size_t
    frameStartCompressed( size_t frameIndex ) const
    {
        return m_seekTable.frameStartCompressed( frameIndex );
    }

    [[nodiscard]] size_t
    frameEndCompressed( size_t frameIndex ) const
    {
        return m_seekTable.frameEndCompressed( frameIndex );
    }

    [[nodiscard]] size_t
    frameIndexDecompressed( size_t dataOffset ) const noexcept
    {
        return m_seekTable.frameIndexDecompressed( dataOffset );
    }

    /**
     * Restricts all following decompress calls to the frames [lowerFrame, upperFrame] and rewinds the cursor.
     */
    void
    setDecodeWindow( size_t lowerFrame,
                     size_t upperFrame )
    {
        if ( ( lowerFrame > upperFrame ) || ( upperFrame >= frameCount() ) ) {
            std::stringstream msg;
            msg << "Invalid decode window [" << lowerFrame << ", " << upperFrame << "] for an archive with "
                << frameCount() << " frames!";
            throw CodecError( msg.str() );
        }

        m_lowerFrame = lowerFrame;
        m_upperFrame = upperFrame;
        reset();
    }

    /**
     * Rewinds the cursor to the first frame of the current decode window.
     */
    void
    reset()
    {
        const auto returnCode = ZSTD_DCtx_reset( m_context.get(), ZSTD_reset_session_only );
        if ( ZSTD_isError( returnCode ) ) {
            throw CodecError( std::string( "Failed to reset the decompression context: " )
                              + ZSTD_getErrorName( returnCode ) );
        }

        if ( frameCount() == 0 ) {
            m_encodedPosition = 0;
            m_encodedEnd = 0;
        } else {
            m_encodedPosition = m_seekTable.frameStartCompressed( m_lowerFrame );
            m_encodedEnd = m_seekTable.frameEndCompressed( m_upperFrame );
        }

        m_input = ZSTD_inBuffer{ m_inputBuffer.data(), 0, 0 };
        m_frameFinished = true;
    }

    /**
     * Decompresses as many bytes of the current window as fit into the given buffer.
     *
     * @return the number of bytes written. Only returns 0 when the window has been exhausted
     *         (or when @p nBytesToDecode is 0).
     */
    [[nodiscard]] size_t
    decompress( char*  outputBuffer,
                size_t nBytesToDecode )
    {
        ZSTD_outBuffer output{ outputBuffer, nBytesToDecode, 0 };

        while ( output.pos < output.size ) {
            if ( m_input.pos < m_input.size ) {
                decompressStep( output );
                continue;
            }

            if ( m_encodedPosition < m_encodedEnd ) {
                refillInput();
                continue;
            }

            if ( m_frameFinished ) {
                break;
            }

            /* All input has been consumed but the context might still hold data which did not fit into the
             * output buffer during the last call. If it doesn't, then the compressed data is truncated. */
            const auto oldOutputPosition = output.pos;
            decompressStep( output );
            if ( !m_frameFinished && ( output.pos == oldOutputPosition ) ) {
                throw CodecError( "The compressed data ended in the middle of a zstd frame!" );
            }
        }

        return output.pos;
    }

    /**
     * Consumes the remainder of the current zstd frame, i.e., its content checksum, which zstd only verifies
     * when it reaches it. Call this after all bytes of the window have been decompressed.
     *
     * @throws CodecError if the frame still contains data, the checksum does not match, or the frame is truncated.
     */
    void
    finishFrame()
    {
        std::array<char, 1> scratch{};
        ZSTD_outBuffer output{ scratch.data(), scratch.size(), 0 };

        while ( !m_frameFinished ) {
            if ( ( m_input.pos >= m_input.size ) && ( m_encodedPosition < m_encodedEnd ) ) {
                refillInput();
            }

            const auto oldInputPosition = m_input.pos;
            decompressStep( output );
            if ( output.pos > 0 ) {
                throw CodecError( "The zstd frame contains more data than listed in the seek table!" );
            }
            if ( !m_frameFinished && ( m_input.pos == oldInputPosition ) && ( m_encodedPosition >= m_encodedEnd ) ) {
                throw CodecError( "The compressed data ended in the middle of a zstd frame!" );
            }
        }
    }

private:
    [[nodiscard]] static seekable::SeekTable
    readSeekTableFrom( FileReader* file )
    {
        if ( file == nullptr ) {
            throw std::invalid_argument( "May not give invalid pointers as arguments!" );
        }
        if ( file->closed() ) {
            throw IoError( "Cannot decode from a closed file!" );
        }
        return seekable::readSeekTable( *file );
    }

    [[nodiscard]] static UniqueDecompressionContext
    createContext()
    {
        UniqueDecompressionContext context( ZSTD_createDCtx() );
        if ( !context ) {
            throw CodecError( "Failed to create a decompression context!" );
        }
        return context;
    }

    void
    refillInput()
    {
        const auto nBytesToRead = std::min( m_inputBuffer.size(), m_encodedEnd - m_encodedPosition );
        m_file->readExactly( m_encodedPosition, m_inputBuffer.data(), nBytesToRead );
        m_encodedPosition += nBytesToRead;
        m_input = ZSTD_inBuffer{ m_inputBuffer.data(), nBytesToRead, 0 };
    }

    void
    decompressStep( ZSTD_outBuffer& output )
    {
        const auto returnCode = ZSTD_decompressStream( m_context.get(), &output, &m_input );
        if ( ZSTD_isError( returnCode ) ) {
            throw CodecError( ZSTD_getErrorName( returnCode ) );
        }
        m_frameFinished = returnCode == 0;
    }

private:
    UniqueFileReader m_file;
    seekable::SeekTable m_seekTable;
    UniqueDecompressionContext m_context;

    size_t m_lowerFrame{ 0 };
    size_t m_upperFrame{ 0 };

    /** Absolute offset of the next compressed byte to load and of the end of the current window. */
    size_t m_encodedPosition{ 0 };
    size_t m_encodedEnd{ 0 };

    std::vector<char> m_inputBuffer = std::vector<char>( IOBUF_SIZE );
    ZSTD_inBuffer m_input{ nullptr, 0, 0 };
    /** True when the last zstd call finished a frame, i.e., when no partial frame is pending. */
    bool m_frameFinished{ true };
};
