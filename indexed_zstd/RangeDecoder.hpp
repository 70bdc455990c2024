#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "Error.hpp"
#include "FileReader.hpp"
#include "SeekableDecoder.hpp"
#include "common.hpp"


/**
 * Reads arbitrary ranges of the decompressed stream from a seekable zstd archive.
 * Only the frames overlapping the requested range are decoded.
 *
 * @note Not thread-safe because the underlying decode cursor is stateful. It may be reused for
 *       sequential requests but concurrent requests each need their own instance.
 */
class RangeDecoder
{
public:
    explicit
    RangeDecoder( UniqueFileReader file ) :
        m_decoder( std::move( file ) )
    {}

    explicit
    RangeDecoder( const std::string& filePath ) :
        m_decoder( filePath )
    {}

    /** @return the total decompressed size in bytes. */
    [[nodiscard]] size_t
    size() const noexcept
    {
        return m_decoder.seekTable().decodedSize();
    }

    [[nodiscard]] size_t
    frameCount() const noexcept
    {
        return m_decoder.frameCount();
    }

    [[nodiscard]] const seekable::SeekTable&
    seekTable() const noexcept
    {
        return m_decoder.seekTable();
    }

    /**
     * @return the decompressed bytes in [start, end). The result is shorter than requested
     *         if the range reaches past the end of the stream and empty if it starts after it.
     */
    [[nodiscard]] std::vector<uint8_t>
    readRange( uint64_t start,
               uint64_t end )
    {
        if ( end < start ) {
            throw FormatError( "End offset cannot be less than start offset" );
        }

        if ( ( end == start ) || ( frameCount() == 0 ) ) {
            return {};
        }

        /* Offsets are uint64_t to be independent of the host, but the decoder only addresses size_t. */
        if ( ( start > std::numeric_limits<size_t>::max() ) || ( end > std::numeric_limits<size_t>::max() ) ) {
            throw FormatError( "Offset too large for size_t" );
        }

        const auto startFrame = m_decoder.frameIndexDecompressed( static_cast<size_t>( start ) );
        const auto endFrame = m_decoder.frameIndexDecompressed( static_cast<size_t>( end - 1 ) );

        m_decoder.setDecodeWindow( startFrame, endFrame );

        const auto windowOffset = m_decoder.frameStartDecompressed( startFrame );
        const auto windowSize = m_decoder.frameEndDecompressed( endFrame ) - windowOffset;
        const auto nBytesToSkip = start >= windowOffset ? static_cast<size_t>( start - windowOffset ) : size_t( 0 );
        const auto nBytesWanted = static_cast<size_t>( end - start );

        std::vector<uint8_t> window( windowSize );

        m_decoder.reset();
        size_t nBytesDecoded = 0;
        while ( nBytesDecoded < window.size() ) {
            const auto nBytesDecodedNow = m_decoder.decompress( reinterpret_cast<char*>( window.data() ) + nBytesDecoded,
                                                                window.size() - nBytesDecoded );
            if ( nBytesDecodedNow == 0 ) {
                break;
            }
            nBytesDecoded += nBytesDecodedNow;
        }

        /* The last frame of the window is only verified by zstd after reading past its data. */
        if ( nBytesDecoded == window.size() ) {
            m_decoder.finishFrame();
        }

        if ( nBytesToSkip >= nBytesDecoded ) {
            return {};
        }

        const auto rangeEnd = nBytesWanted > nBytesDecoded - nBytesToSkip ? nBytesDecoded : nBytesToSkip + nBytesWanted;
        return std::vector<uint8_t>( window.begin() + nBytesToSkip, window.begin() + rangeEnd );
    }

    /**
     * Reads [offset, offset + nBytesToRead) into the given buffer.
     *
     * @return the number of bytes written to the buffer, which is only smaller than requested at the end of the stream.
     */
    [[nodiscard]] size_t
    readAt( char*    outputBuffer,
            size_t   nBytesToRead,
            uint64_t offset )
    {
        if ( additionOverflows<uint64_t>( offset, nBytesToRead ) ) {
            throw FormatError( "Range end does not fit into 64-bit offsets" );
        }

        const auto data = readRange( offset, offset + nBytesToRead );
        const auto nBytesRead = std::min( nBytesToRead, data.size() );
        if ( nBytesRead > 0 ) {
            std::memcpy( outputBuffer, data.data(), nBytesRead );
        }
        return nBytesRead;
    }

private:
    SeekableDecoder m_decoder;
};
