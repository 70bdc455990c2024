#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <Error.hpp>
#include <FileReader.hpp>
#include <SeekableDecoder.hpp>
#include <SeekableEncoder.hpp>
#include <SeekTable.hpp>

#include "TestHelpers.hpp"


namespace
{
[[nodiscard]] SeekableDecoder
decoderFromBuffer( std::vector<uint8_t> archive )
{
    return SeekableDecoder( std::make_unique<SharedBufferFileReader>( std::move( archive ) ) );
}


[[nodiscard]] std::vector<uint8_t>
decompressWindow( SeekableDecoder& decoder,
                  size_t           bufferSize = 7 )
{
    std::vector<uint8_t> result;
    std::vector<char> buffer( bufferSize );
    while ( true ) {
        const auto nBytesDecoded = decoder.decompress( buffer.data(), buffer.size() );
        if ( nBytesDecoded == 0 ) {
            break;
        }
        result.insert( result.end(), buffer.begin(), buffer.begin() + nBytesDecoded );
    }
    return result;
}


/** @return the archive without its seek table. */
[[nodiscard]] std::vector<uint8_t>
stripSeekTable( std::vector<uint8_t> archive,
                size_t               frameCount )
{
    archive.resize( archive.size() - ( seekable::SKIPPABLE_HEADER_SIZE + 8 * frameCount
                                       + seekable::SEEK_TABLE_FOOTER_SIZE ) );
    return archive;
}
}


void
testFileReaders()
{
    std::vector<uint8_t> bytes( 100 );
    for ( size_t i = 0; i < bytes.size(); ++i ) {
        bytes[i] = static_cast<uint8_t>( i );
    }

    SharedBufferFileReader reader( bytes );
    REQUIRE_EQUAL( reader.size(), size_t( 100 ) );

    std::vector<char> buffer( 5 );
    reader.readExactly( 10, buffer.data(), buffer.size() );
    REQUIRE_EQUAL( static_cast<int>( buffer[0] ), 10 );
    REQUIRE_EQUAL( static_cast<int>( buffer[4] ), 14 );

    /* Clones have their own position. */
    auto clone = reader.clone();
    clone->seek( 50 );
    REQUIRE_EQUAL( reader.read( buffer.data(), 1 ), size_t( 1 ) );
    REQUIRE_EQUAL( static_cast<int>( buffer[0] ), 15 );
    REQUIRE_EQUAL( clone->read( buffer.data(), 1 ), size_t( 1 ) );
    REQUIRE_EQUAL( static_cast<int>( buffer[0] ), 50 );

    /* Seeking after the end is allowed but reads return nothing. */
    reader.seek( 200 );
    REQUIRE_EQUAL( reader.read( buffer.data(), buffer.size() ), size_t( 0 ) );
    REQUIRE_THROWS( IoError, reader.readExactly( 98, buffer.data(), buffer.size() ) );

    reader.close();
    REQUIRE( reader.closed() );
    REQUIRE( !clone->closed() );
    REQUIRE_THROWS( IoError, reader.read( buffer.data(), 1 ) );
    REQUIRE_THROWS( IoError, reader.seek( 0 ) );
    REQUIRE_THROWS( IoError, reader.clone() );

    const TemporaryDirectory temporaryDirectory;
    const auto filePath = ( temporaryDirectory.path() / "bytes.bin" ).string();
    {
        std::ofstream file( filePath, std::ios::binary );
        file.write( reinterpret_cast<const char*>( bytes.data() ), static_cast<std::streamsize>( bytes.size() ) );
    }

    StandardFileReader file( filePath );
    REQUIRE_EQUAL( file.size(), size_t( 100 ) );
    auto fileClone = file.clone();
    file.readExactly( 95, buffer.data(), buffer.size() );
    REQUIRE_EQUAL( static_cast<int>( buffer[4] ), 99 );
    REQUIRE_EQUAL( fileClone->read( buffer.data(), 1 ), size_t( 1 ) );
    REQUIRE_EQUAL( static_cast<int>( buffer[0] ), 0 );
    REQUIRE_THROWS( IoError, file.readExactly( 96, buffer.data(), buffer.size() ) );

    file.close();
    REQUIRE_THROWS( IoError, file.read( buffer.data(), 1 ) );
    REQUIRE_THROWS( IoError, file.clone() );
}


void
testSeekTableSerialization()
{
    const seekable::SeekTable table( { 10, 20, 5 }, { 100, 0, 50 } );
    REQUIRE_EQUAL( table.frameCount(), size_t( 3 ) );
    REQUIRE_EQUAL( table.encodedSize(), size_t( 35 ) );
    REQUIRE_EQUAL( table.decodedSize(), size_t( 150 ) );
    REQUIRE_EQUAL( table.frameStartCompressed( 1 ), size_t( 10 ) );
    REQUIRE_EQUAL( table.frameEndCompressed( 1 ), size_t( 30 ) );
    REQUIRE_EQUAL( table.frameStartDecompressed( 2 ), size_t( 100 ) );
    REQUIRE_EQUAL( table.frameEndDecompressed( 2 ), size_t( 150 ) );
    REQUIRE_THROWS( CodecError, table.frameStartDecompressed( 3 ) );
    REQUIRE_THROWS( CodecError, table.frameEndCompressed( 3 ) );

    /* The empty frame 1 never contains any offset. */
    REQUIRE_EQUAL( table.frameIndexDecompressed( 99 ), size_t( 0 ) );
    REQUIRE_EQUAL( table.frameIndexDecompressed( 100 ), size_t( 2 ) );
    REQUIRE_EQUAL( table.frameIndexDecompressed( 1000 ), size_t( 2 ) );

    const auto frame = table.frameInfo( 2 );
    REQUIRE( frame.contains( 100 ) );
    REQUIRE( frame.contains( 149 ) );
    REQUIRE( !frame.contains( 150 ) );
    REQUIRE_EQUAL( frame.encodedOffsetInBytes, size_t( 30 ) );
    REQUIRE_EQUAL( frame.encodedSizeInBytes, size_t( 5 ) );

    /* Serialize behind 35 dummy bytes standing in for the frames and parse it again. */
    std::vector<uint8_t> file( 35, 0 );
    const auto serialized = table.serialize();
    REQUIRE_EQUAL( serialized.size(), seekable::SKIPPABLE_HEADER_SIZE + 3 * 8 + seekable::SEEK_TABLE_FOOTER_SIZE );
    file.insert( file.end(), serialized.begin(), serialized.end() );

    SharedBufferFileReader reader( std::move( file ) );
    const auto parsed = seekable::readSeekTable( reader );
    REQUIRE( parsed == table );
    REQUIRE( !parsed.hasChecksums() );
}


void
testInvalidSeekTables()
{
    const auto archive = compressToBuffer( toBytes( "Some data to compress" ), 8 );

    /* Too small */
    REQUIRE_THROWS( CodecError, decoderFromBuffer( std::vector<uint8_t>( 10, 0 ) ) );

    /* Plain zstd frames without seek table */
    REQUIRE_THROWS( CodecError, decoderFromBuffer( stripSeekTable( archive, 3 ) ) );

    /* Wrong seekable magic */
    {
        auto broken = archive;
        broken.back() ^= 0xFFU;
        REQUIRE_THROWS( CodecError, decoderFromBuffer( broken ) );
    }

    /* Reserved descriptor bits */
    {
        auto broken = archive;
        broken[broken.size() - 5] = 0x04;
        REQUIRE_THROWS( CodecError, decoderFromBuffer( broken ) );
    }

    /* Frame count larger than the file */
    {
        auto broken = archive;
        broken[broken.size() - 9] = 0xFF;
        REQUIRE_THROWS( CodecError, decoderFromBuffer( broken ) );
    }

    /* Additional bytes before the frames do not match the seek table */
    {
        std::vector<uint8_t> broken( 3, 0 );
        broken.insert( broken.end(), archive.begin(), archive.end() );
        REQUIRE_THROWS( CodecError, decoderFromBuffer( broken ) );
    }

    REQUIRE_THROWS( std::invalid_argument, SeekableDecoder( UniqueFileReader() ) );
}


void
testSeekTableWithChecksums()
{
    const std::string data = "Frame with a checksum entry in its seek table";
    const auto archive = compressToBuffer( toBytes( data ), data.size() );
    auto file = stripSeekTable( archive, 1 );
    const auto compressedSize = static_cast<uint32_t>( file.size() );

    seekable::appendLittleEndian32( file, seekable::SKIPPABLE_MAGIC_NUMBER );
    seekable::appendLittleEndian32( file, 12 + seekable::SEEK_TABLE_FOOTER_SIZE );
    seekable::appendLittleEndian32( file, compressedSize );
    seekable::appendLittleEndian32( file, static_cast<uint32_t>( data.size() ) );
    seekable::appendLittleEndian32( file, 0xDEADBEEFU );
    seekable::appendLittleEndian32( file, 1 );
    file.push_back( seekable::DESCRIPTOR_CHECKSUM_FLAG );
    seekable::appendLittleEndian32( file, seekable::SEEKABLE_MAGIC_NUMBER );

    auto decoder = decoderFromBuffer( file );
    REQUIRE( decoder.seekTable().hasChecksums() );
    REQUIRE_EQUAL( decoder.frameCount(), size_t( 1 ) );
    REQUIRE_EQUAL( asString( decompressWindow( decoder ) ), data );
}


void
testFrameLookup()
{
    const auto data = createTestData( 100 );
    auto decoder = decoderFromBuffer( compressToBuffer( data, 30 ) );

    REQUIRE_EQUAL( decoder.frameCount(), size_t( 4 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 0 ), size_t( 0 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 29 ), size_t( 0 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 30 ), size_t( 1 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 89 ), size_t( 2 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 99 ), size_t( 3 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 100 ), size_t( 3 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 12345 ), size_t( 3 ) );

    REQUIRE_EQUAL( decoder.frameStartDecompressed( 3 ), size_t( 90 ) );
    REQUIRE_EQUAL( decoder.frameEndDecompressed( 3 ), size_t( 100 ) );
    REQUIRE_EQUAL( decoder.frameStartCompressed( 0 ), size_t( 0 ) );
    REQUIRE_EQUAL( decoder.frameEndCompressed( 0 ), decoder.frameStartCompressed( 1 ) );
    REQUIRE_THROWS( CodecError, decoder.frameStartDecompressed( 4 ) );
}


void
testDecodeWindows()
{
    const auto data = createTestData( 10000 );
    auto decoder = decoderFromBuffer( compressToBuffer( data, 1000 ) );
    REQUIRE_EQUAL( decoder.frameCount(), size_t( 10 ) );

    /* The default window spans the whole archive. */
    REQUIRE( decompressWindow( decoder, 333 ) == data );

    /* Exhausted windows keep returning 0. */
    char dummy = 0;
    REQUIRE_EQUAL( decoder.decompress( &dummy, 1 ), size_t( 0 ) );

    decoder.setDecodeWindow( 3, 5 );
    const std::vector<uint8_t> expected( data.begin() + 3000, data.begin() + 6000 );
    REQUIRE( decompressWindow( decoder ) == expected );

    decoder.reset();
    REQUIRE( decompressWindow( decoder, 1 ) == expected );

    decoder.setDecodeWindow( 9, 9 );
    REQUIRE( decompressWindow( decoder, 4096 ) == std::vector<uint8_t>( data.begin() + 9000, data.end() ) );

    REQUIRE_THROWS( CodecError, decoder.setDecodeWindow( 5, 3 ) );
    REQUIRE_THROWS( CodecError, decoder.setDecodeWindow( 0, 10 ) );
}


void
testEmptyArchive()
{
    auto decoder = decoderFromBuffer( compressToBuffer( {}, 16 ) );
    REQUIRE_EQUAL( decoder.frameCount(), size_t( 0 ) );
    REQUIRE_EQUAL( decoder.seekTable().decodedSize(), size_t( 0 ) );
    REQUIRE_EQUAL( decoder.frameIndexDecompressed( 5 ), size_t( 0 ) );

    char buffer[16];
    REQUIRE_EQUAL( decoder.decompress( buffer, sizeof( buffer ) ), size_t( 0 ) );
    REQUIRE_THROWS( CodecError, decoder.setDecodeWindow( 0, 0 ) );
}


void
testCorruptedFrames()
{
    const auto data = createTestData( 5000 );
    const auto archive = compressToBuffer( data, 1000 );

    /* Broken zstd frame magic in the first frame. */
    {
        auto broken = archive;
        broken[0] ^= 0xFFU;
        auto decoder = decoderFromBuffer( broken );
        REQUIRE_THROWS( CodecError, decompressWindow( decoder ) );

        /* Other frames are still readable. */
        decoder.setDecodeWindow( 1, 4 );
        REQUIRE( decompressWindow( decoder ) == std::vector<uint8_t>( data.begin() + 1000, data.end() ) );
    }

    /* Seek table claiming a frame boundary in the middle of the first zstd frame. */
    {
        auto table = seekable::SeekTable();
        {
            SharedBufferFileReader reader( archive );
            table = seekable::readSeekTable( reader );
        }

        const auto firstFrameSize = static_cast<uint32_t>( table.frameEndCompressed( 0 ) );
        auto broken = stripSeekTable( archive, table.frameCount() );
        broken.resize( firstFrameSize );
        const auto brokenTable = seekable::SeekTable( { firstFrameSize - 5, 5 }, { 1000, 0 } ).serialize();
        broken.insert( broken.end(), brokenTable.begin(), brokenTable.end() );

        auto decoder = decoderFromBuffer( broken );
        decoder.setDecodeWindow( 0, 0 );
        REQUIRE_THROWS( CodecError, decompressWindow( decoder ) );
    }
}


void
testEncoderOptions()
{
    std::vector<uint8_t> output;

    {
        std::vector<uint8_t> defaultOutput;
        SeekableEncoder defaultEncoder( &defaultOutput );
        defaultEncoder.write( createTestData( SeekableEncoder::DEFAULT_FRAME_SIZE + 10 ) );
        REQUIRE_EQUAL( defaultEncoder.frameCount(), size_t( 1 ) );
        defaultEncoder.finish();
        REQUIRE_EQUAL( defaultEncoder.frameCount(), size_t( 2 ) );

        const auto defaultDecoder = decoderFromBuffer( defaultOutput );
        REQUIRE_EQUAL( defaultDecoder.frameCount(), size_t( 2 ) );
        REQUIRE_EQUAL( defaultDecoder.frameEndDecompressed( 0 ), SeekableEncoder::DEFAULT_FRAME_SIZE );
    }

    SeekableEncoder::Options options;
    options.frameSize = 0;
    REQUIRE_THROWS( FormatError, SeekableEncoder( &output, options ) );

    options.frameSize = 1024;
    options.compressionLevel = 1000;
    REQUIRE_THROWS( FormatError, SeekableEncoder( &output, options ) );

    options.compressionLevel = 19;
    options.contentChecksums = false;
    SeekableEncoder encoder( &output, options );
    encoder.write( createTestData( 4096 ) );
    REQUIRE_EQUAL( encoder.frameCount(), size_t( 4 ) );
    encoder.write( std::string( "tail" ) );

    const auto nBytesWritten = encoder.finish();
    REQUIRE_EQUAL( nBytesWritten, output.size() );
    REQUIRE_EQUAL( encoder.frameCount(), size_t( 5 ) );
    REQUIRE_THROWS( std::logic_error, encoder.finish() );
    REQUIRE_THROWS( std::logic_error, encoder.write( std::string( "more" ) ) );

    auto decoder = decoderFromBuffer( output );
    auto expected = createTestData( 4096 );
    const std::string tail = "tail";
    expected.insert( expected.end(), tail.begin(), tail.end() );
    REQUIRE( decompressWindow( decoder, 1000 ) == expected );
}


void
testFiles()
{
    const TemporaryDirectory temporaryDirectory;
    const auto archivePath = ( temporaryDirectory.path() / "archive.zst" ).string();
    const auto data = createTestData( 3000 );

    {
        SeekableEncoder::Options options;
        options.frameSize = 500;
        SeekableEncoder encoder( archivePath, options );
        encoder.write( data );
        encoder.finish();
    }

    SeekableDecoder decoder( archivePath );
    REQUIRE_EQUAL( decoder.frameCount(), size_t( 6 ) );
    REQUIRE( decompressWindow( decoder, 64 ) == data );

    const auto textPath = ( temporaryDirectory.path() / "text.txt" ).string();
    {
        std::ofstream textFile( textPath );
        textFile << "This is not a seekable zstd archive but long enough to contain a footer.";
    }
    REQUIRE_THROWS( CodecError, SeekableDecoder( textPath ) );

    REQUIRE_THROWS( IoError, SeekableDecoder( ( temporaryDirectory.path() / "missing.zst" ).string() ) );
    REQUIRE_THROWS( IoError, SeekableEncoder( ( temporaryDirectory.path() / "no" / "such" / "dir" ).string() ) );
}


int
main()
{
    testFileReaders();
    testSeekTableSerialization();
    testInvalidSeekTables();
    testSeekTableWithChecksums();
    testFrameLookup();
    testDecodeWindows();
    testEmptyArchive();
    testCorruptedFrames();
    testEncoderOptions();
    testFiles();

    std::cout << "Tests successful: " << ( gnTests - gnTestErrors ) << " / " << gnTests << "\n";

    return gnTestErrors;
}
