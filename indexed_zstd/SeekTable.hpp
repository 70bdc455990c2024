#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include "Error.hpp"
#include "FileReader.hpp"
#include "common.hpp"


namespace seekable
{
/**
 * @verbatim
 * Archive layout:
 *   [zstd frame 0] ... [zstd frame N-1] [skippable frame containing the seek table]
 *
 * Seek table (skippable frame):
 *   u32 skippable magic | u32 frame content size | N entries | footer
 *   entry:  u32 compressed size | u32 decompressed size [| u32 checksum]
 *   footer: u32 number of frames | u8 descriptor | u32 seekable magic
 * All integers are little endian.
 * @endverbatim
 */
constexpr uint32_t SKIPPABLE_MAGIC_NUMBER = 0x184D2A5EU;
constexpr uint32_t SEEKABLE_MAGIC_NUMBER = 0x8F92EAB1U;
constexpr size_t SKIPPABLE_HEADER_SIZE = 8;
constexpr size_t SEEK_TABLE_FOOTER_SIZE = 9;
constexpr uint32_t MAX_FRAMES = 0x8000000U;

constexpr uint8_t DESCRIPTOR_CHECKSUM_FLAG = 1U << 7U;
constexpr uint8_t DESCRIPTOR_RESERVED_BITS = 0b0111'1100U;


[[nodiscard]] inline uint32_t
loadLittleEndian32( const uint8_t* data )
{
    return static_cast<uint32_t>( data[0] )
           | ( static_cast<uint32_t>( data[1] ) << 8U )
           | ( static_cast<uint32_t>( data[2] ) << 16U )
           | ( static_cast<uint32_t>( data[3] ) << 24U );
}


inline void
appendLittleEndian32( std::vector<uint8_t>& out,
                      uint32_t              value )
{
    for ( int i = 0; i < 4; ++i ) {
        out.push_back( static_cast<uint8_t>( ( value >> ( 8U * i ) ) & 0xFFU ) );
    }
}


/**
 * Maps frame indexes to their compressed and decompressed extents. The frame extents are contiguous
 * and therefore stored as cumulative offsets, i.e., frame i spans [offsets[i], offsets[i+1]).
 * Immutable after construction, so it can be read from any number of threads.
 */
class SeekTable
{
public:
    struct FrameInfo
    {
    public:
        [[nodiscard]] bool
        contains( size_t dataOffset ) const
        {
            return ( decodedOffsetInBytes <= dataOffset ) && ( dataOffset < decodedOffsetInBytes + decodedSizeInBytes );
        }

    public:
        size_t frameIndex{ 0 };
        size_t encodedOffsetInBytes{ 0 };
        size_t encodedSizeInBytes{ 0 };
        size_t decodedOffsetInBytes{ 0 };
        size_t decodedSizeInBytes{ 0 };
    };

public:
    SeekTable() = default;

    /**
     * @param encodedSizes Compressed sizes of all zstd frames in stream order.
     * @param decodedSizes Decompressed sizes of all zstd frames in stream order.
     */
    SeekTable( const std::vector<uint32_t>& encodedSizes,
               const std::vector<uint32_t>& decodedSizes,
               bool                         hasChecksums = false ) :
        m_hasChecksums( hasChecksums )
    {
        if ( encodedSizes.size() != decodedSizes.size() ) {
            throw std::invalid_argument( "Compressed and decompressed frame size lists must be equally long!" );
        }

        m_encodedOffsets.reserve( encodedSizes.size() + 1 );
        m_decodedOffsets.reserve( decodedSizes.size() + 1 );
        m_encodedOffsets.push_back( 0 );
        m_decodedOffsets.push_back( 0 );

        for ( size_t i = 0; i < encodedSizes.size(); ++i ) {
            /* On 32-bit hosts, large archives may not be addressable. */
            if ( additionOverflows<size_t>( m_encodedOffsets.back(), encodedSizes[i] )
                 || additionOverflows<size_t>( m_decodedOffsets.back(), decodedSizes[i] ) ) {
                throw FormatError( "Archive offsets do not fit into the addressable range!" );
            }
            m_encodedOffsets.push_back( m_encodedOffsets.back() + encodedSizes[i] );
            m_decodedOffsets.push_back( m_decodedOffsets.back() + decodedSizes[i] );
        }
    }

    [[nodiscard]] size_t
    frameCount() const noexcept
    {
        return m_encodedOffsets.empty() ? 0 : m_encodedOffsets.size() - 1;
    }

    [[nodiscard]] bool
    hasChecksums() const noexcept
    {
        return m_hasChecksums;
    }

    /** @return total decompressed size of all frames. */
    [[nodiscard]] size_t
    decodedSize() const noexcept
    {
        return m_decodedOffsets.empty() ? 0 : m_decodedOffsets.back();
    }

    /** @return total compressed size of all frames without the seek table. */
    [[nodiscard]] size_t
    encodedSize() const noexcept
    {
        return m_encodedOffsets.empty() ? 0 : m_encodedOffsets.back();
    }

    [[nodiscard]] size_t
    frameStartDecompressed( size_t frameIndex ) const
    {
        checkFrameIndex( frameIndex );
        return m_decodedOffsets[frameIndex];
    }

    [[nodiscard]] size_t
    frameEndDecompressed( size_t frameIndex ) const
    {
        checkFrameIndex( frameIndex );
        return m_decodedOffsets[frameIndex + 1];
    }

    [[nodiscard]] size_t
    frameStartCompressed( size_t frameIndex ) const
    {
        checkFrameIndex( frameIndex );
        return m_encodedOffsets[frameIndex];
    }

    [[nodiscard]] size_t
    frameEndCompressed( size_t frameIndex ) const
    {
        checkFrameIndex( frameIndex );
        return m_encodedOffsets[frameIndex + 1];
    }

    /**
     * Returns the index of the frame containing the given decompressed offset.
     * Offsets at or after the end are mapped to the last frame. Frames with zero decompressed size
     * never contain an offset and are skipped. For an empty table, 0 is returned.
     */
    [[nodiscard]] size_t
    frameIndexDecompressed( size_t dataOffset ) const noexcept
    {
        if ( frameCount() == 0 ) {
            return 0;
        }

        if ( dataOffset >= decodedSize() ) {
            return frameCount() - 1;
        }

        /* The first offset larger than dataOffset is the end offset of the frame we look for. */
        const auto frameEnd = std::upper_bound( m_decodedOffsets.begin(), m_decodedOffsets.end(), dataOffset );
        return static_cast<size_t>( std::distance( m_decodedOffsets.begin(), frameEnd ) ) - 1;
    }

    [[nodiscard]] FrameInfo
    frameInfo( size_t frameIndex ) const
    {
        checkFrameIndex( frameIndex );

        FrameInfo result;
        result.frameIndex = frameIndex;
        result.encodedOffsetInBytes = m_encodedOffsets[frameIndex];
        result.encodedSizeInBytes = m_encodedOffsets[frameIndex + 1] - m_encodedOffsets[frameIndex];
        result.decodedOffsetInBytes = m_decodedOffsets[frameIndex];
        result.decodedSizeInBytes = m_decodedOffsets[frameIndex + 1] - m_decodedOffsets[frameIndex];
        return result;
    }

    /**
     * Serializes the table as a skippable frame without checksums.
     */
    [[nodiscard]] std::vector<uint8_t>
    serialize() const
    {
        const auto nFrames = frameCount();
        if ( nFrames > MAX_FRAMES ) {
            throw FormatError( "Too many frames for the seek table!" );
        }

        std::vector<uint8_t> result;
        result.reserve( SKIPPABLE_HEADER_SIZE + nFrames * 8 + SEEK_TABLE_FOOTER_SIZE );

        appendLittleEndian32( result, SKIPPABLE_MAGIC_NUMBER );
        appendLittleEndian32( result, static_cast<uint32_t>( nFrames * 8 + SEEK_TABLE_FOOTER_SIZE ) );
        for ( size_t i = 0; i < nFrames; ++i ) {
            appendLittleEndian32( result, static_cast<uint32_t>( m_encodedOffsets[i + 1] - m_encodedOffsets[i] ) );
            appendLittleEndian32( result, static_cast<uint32_t>( m_decodedOffsets[i + 1] - m_decodedOffsets[i] ) );
        }
        appendLittleEndian32( result, static_cast<uint32_t>( nFrames ) );
        result.push_back( 0 );
        appendLittleEndian32( result, SEEKABLE_MAGIC_NUMBER );

        return result;
    }

    [[nodiscard]] bool
    operator==( const SeekTable& other ) const
    {
        return ( m_encodedOffsets == other.m_encodedOffsets ) && ( m_decodedOffsets == other.m_decodedOffsets );
    }

    [[nodiscard]] bool
    operator!=( const SeekTable& other ) const
    {
        return !( *this == other );
    }

private:
    void
    checkFrameIndex( size_t frameIndex ) const
    {
        if ( frameIndex >= frameCount() ) {
            std::stringstream msg;
            msg << "Frame index " << frameIndex << " is out of range for an archive with "
                << frameCount() << " frames!";
            throw CodecError( msg.str() );
        }
    }

private:
    std::vector<size_t> m_encodedOffsets;
    std::vector<size_t> m_decodedOffsets;
    bool m_hasChecksums{ false };
};


inline std::ostream&
operator<<( std::ostream&                 out,
            const SeekTable::FrameInfo& frame )
{
    out << "FrameInfo {\n";
    out << "  frameIndex           : " << frame.frameIndex           << "\n";
    out << "  encodedOffsetInBytes : " << frame.encodedOffsetInBytes << "\n";
    out << "  encodedSizeInBytes   : " << frame.encodedSizeInBytes   << "\n";
    out << "  decodedOffsetInBytes : " << frame.decodedOffsetInBytes << "\n";
    out << "  decodedSizeInBytes   : " << frame.decodedSizeInBytes   << "\n";
    out << "}\n";
    return out;
}


/**
 * Reads the seek table from the end of the given file and checks it for consistency with the file size.
 * The file position is undefined afterwards.
 */
[[nodiscard]] inline SeekTable
readSeekTable( FileReader& file )
{
    const auto fileSize = file.size();
    if ( fileSize < SKIPPABLE_HEADER_SIZE + SEEK_TABLE_FOOTER_SIZE ) {
        throw CodecError( "File is too small to contain a seek table!" );
    }

    std::array<uint8_t, SEEK_TABLE_FOOTER_SIZE> footer{};
    file.readExactly( fileSize - footer.size(), reinterpret_cast<char*>( footer.data() ), footer.size() );

    if ( loadLittleEndian32( footer.data() + 5 ) != SEEKABLE_MAGIC_NUMBER ) {
        throw CodecError( "Seek table footer does not end with the seekable magic number!" );
    }

    const auto descriptor = footer[4];
    if ( ( descriptor & DESCRIPTOR_RESERVED_BITS ) != 0 ) {
        throw CodecError( "Reserved bits in the seek table descriptor are set!" );
    }
    const bool hasChecksums = ( descriptor & DESCRIPTOR_CHECKSUM_FLAG ) != 0;

    const auto nFrames = loadLittleEndian32( footer.data() );
    if ( nFrames > MAX_FRAMES ) {
        std::stringstream msg;
        msg << "Seek table contains " << nFrames << " frames, more than the supported " << MAX_FRAMES << "!";
        throw CodecError( msg.str() );
    }

    const size_t entrySize = hasChecksums ? 12 : 8;
    const size_t tableSize = SKIPPABLE_HEADER_SIZE + nFrames * entrySize + SEEK_TABLE_FOOTER_SIZE;
    if ( tableSize > fileSize ) {
        throw CodecError( "Seek table is larger than the file!" );
    }

    std::vector<uint8_t> table( tableSize - SEEK_TABLE_FOOTER_SIZE );
    file.readExactly( fileSize - tableSize, reinterpret_cast<char*>( table.data() ), table.size() );

    if ( loadLittleEndian32( table.data() ) != SKIPPABLE_MAGIC_NUMBER ) {
        throw CodecError( "Seek table does not start with a skippable frame header!" );
    }
    if ( loadLittleEndian32( table.data() + 4 ) != tableSize - SKIPPABLE_HEADER_SIZE ) {
        throw CodecError( "Skippable frame size does not match the number of seek table entries!" );
    }

    std::vector<uint32_t> encodedSizes( nFrames );
    std::vector<uint32_t> decodedSizes( nFrames );
    const auto* entry = table.data() + SKIPPABLE_HEADER_SIZE;
    for ( size_t i = 0; i < nFrames; ++i, entry += entrySize ) {
        /* The checksums are the lowest 32 bits of the XXH64 of the decompressed frame. They are not verified
         * here because the frames themselves carry zstd content checksums. */
        encodedSizes[i] = loadLittleEndian32( entry );
        decodedSizes[i] = loadLittleEndian32( entry + 4 );
    }

    SeekTable result( encodedSizes, decodedSizes, hasChecksums );
    if ( result.encodedSize() != fileSize - tableSize ) {
        std::stringstream msg;
        msg << "The frames in the seek table span " << result.encodedSize() << " B but the file contains "
            << fileSize - tableSize << " B of frames!";
        throw CodecError( msg.str() );
    }

    return result;
}
}  // namespace seekable
