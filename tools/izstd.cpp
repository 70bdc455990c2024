#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <sys/stat.h>

#include <cxxopts.hpp>

#include <Error.hpp>
#include <FileWriter.hpp>
#include <ParallelZstdReader.hpp>
#include <RangeDecoder.hpp>
#include <SeekableEncoder.hpp>
#include <common.hpp>


namespace
{
constexpr const char* VERSION = "0.1.0";

/** Size of the ranges a full decompression is split into to be decoded in parallel. */
constexpr size_t CHUNK_SIZE = 4 * 1024 * 1024;


[[nodiscard]] bool
fileExists( const std::string& filePath )
{
    struct stat fileStats;
    return stat( filePath.c_str(), &fileStats ) == 0;
}


/**
 * Parses "<start>:<end>" into a range in decompressed bytes.
 */
[[nodiscard]] ParallelZstdReader::Range
parseRange( const std::string& rangeString )
{
    const auto separator = rangeString.find( ':' );
    if ( separator == std::string::npos ) {
        throw std::invalid_argument( "Ranges must be given as <start>:<end> but got: " + rangeString );
    }

    const auto parseOffset =
        [&rangeString] ( const std::string& number )
        {
            size_t nCharsParsed = 0;
            const auto value = std::stoull( number, &nCharsParsed );
            if ( number.empty() || ( nCharsParsed != number.size() ) || ( number.front() == '-' ) ) {
                throw std::invalid_argument( "Invalid offset in range: " + rangeString );
            }
            return static_cast<uint64_t>( value );
        };

    return { parseOffset( rangeString.substr( 0, separator ) ), parseOffset( rangeString.substr( separator + 1 ) ) };
}


[[nodiscard]] std::unique_ptr<FileWriter>
openOutput( const std::string& outputFilePath,
            bool               force )
{
    if ( outputFilePath.empty() || ( outputFilePath == "-" ) ) {
        return std::make_unique<StandardFileWriter>( stdout );
    }

    if ( !force && fileExists( outputFilePath ) ) {
        throw std::invalid_argument( "Output file '" + outputFilePath + "' already exists! Use --force to overwrite it." );
    }
    return std::make_unique<StandardFileWriter>( outputFilePath );
}


size_t
compress( const std::string&              inputFilePath,
          std::unique_ptr<FileWriter>     output,
          const SeekableEncoder::Options& options )
{
    StandardFileReader input( inputFilePath );
    SeekableEncoder encoder( std::move( output ), options );

    std::vector<char> buffer( SeekableEncoder::DEFAULT_FRAME_SIZE );
    while ( true ) {
        const auto nBytesRead = input.read( buffer.data(), buffer.size() );
        if ( nBytesRead == 0 ) {
            break;
        }
        encoder.write( buffer.data(), nBytesRead );
    }

    return encoder.finish();
}


size_t
decompress( const ParallelZstdReader&                     reader,
            std::vector<ParallelZstdReader::Range> const& requestedRanges,
            FileWriter&                                   output )
{
    const auto writeResults =
        [&output] ( const std::vector<std::vector<uint8_t> >& results )
        {
            size_t nBytesWritten = 0;
            for ( const auto& result : results ) {
                output.write( reinterpret_cast<const char*>( result.data() ), result.size() );
                nBytesWritten += result.size();
            }
            return nBytesWritten;
        };

    if ( !requestedRanges.empty() ) {
        const auto nBytesWritten = writeResults( reader.readRanges( requestedRanges ) );
        output.flush();
        return nBytesWritten;
    }

    /* Decompress everything in batches of one chunk per worker thread to bound the memory usage. */
    const auto size = reader.size();
    const auto batchSize = CHUNK_SIZE * reader.parallelism();
    size_t nBytesWritten = 0;
    for ( size_t batchOffset = 0; batchOffset < size; batchOffset += batchSize ) {
        std::vector<ParallelZstdReader::Range> ranges;
        const auto batchEnd = std::min( size, batchOffset + batchSize );
        ranges.reserve( ceilDiv( batchEnd - batchOffset, CHUNK_SIZE ) );
        for ( size_t offset = batchOffset; offset < batchEnd; offset += CHUNK_SIZE ) {
            ranges.emplace_back( offset, std::min( batchEnd, offset + CHUNK_SIZE ) );
        }
        nBytesWritten += writeResults( reader.readRanges( ranges ) );
    }

    output.flush();
    return nBytesWritten;
}
}  // namespace


int
main( int argc, char** argv )
{
    cxxopts::Options options( "izstd",
                              "A parallel random access decompressor for seekable zstd archives" );
    options.add_options( "Decompression" )
        ( "c,stdout"    , "Output to standard output." )
        ( "d,decompress", "Force decompression. This is the default." )
        ( "f,force"     , "Force overwriting existing output files." )
        ( "i,input"     , "Input file.", cxxopts::value<std::string>() )
        ( "o,output"    , "Output file. Decompressed data is written to standard output if none is given.",
          cxxopts::value<std::string>() )
        ( "r,range"     , "Only decompress the given range of decompressed bytes specified as <start>:<end>. "
                          "May be given multiple times. All ranges are read in parallel and written in order.",
          cxxopts::value<std::vector<std::string> >() )
        ( "P,decoder-parallelism",
          "Number of threads to decode ranges with. 0 uses all cores.",
          cxxopts::value<unsigned int>()->default_value( "0" ) );

    options.add_options( "Compression" )
        ( "z,compress"  , "Compress the input into a seekable zstd archive." )
        ( "frame-size"  , "Number of uncompressed bytes per frame.",
          cxxopts::value<size_t>()->default_value( std::to_string( SeekableEncoder::DEFAULT_FRAME_SIZE ) ) )
        ( "l,level"     , "Compression level.",
          cxxopts::value<int>()->default_value( std::to_string( ZSTD_CLEVEL_DEFAULT ) ) );

    options.add_options( "Output" )
        ( "h,help"   , "Print this help message." )
        ( "v,verbose", "Be verbose." )
        ( "V,version", "Display software version." )
        ( "info"     , "Print the decompressed size and the number of frames." )
        ( "L,list-offsets",
          "List the frame offsets in the compressed file and the corresponding offsets in the decompressed data "
          "as a comma separated pair per line '<encoded bytes>,<decoded bytes>'." );

    options.parse_positional( { "input" } );

    try {
        const auto parsedArgs = options.parse( argc, argv );

        if ( parsedArgs.count( "help" ) > 0 ) {
            std::cout
            << options.help()
            << "\n"
            << "Without --range, the whole archive is decompressed.\n"
            << "Example: izstd -r 0:100 -r 1000:1100 archive.zst"
            << std::endl;
            return 0;
        }

        if ( parsedArgs.count( "version" ) > 0 ) {
            std::cout << "izstd " << VERSION << std::endl;
            return 0;
        }

        if ( parsedArgs.count( "input" ) == 0 ) {
            std::cerr << "An input file name must be specified!\n";
            return 1;
        }

        const auto inputFilePath = parsedArgs["input"].as<std::string>();
        const auto force = parsedArgs.count( "force" ) > 0;
        const auto verbose = parsedArgs.count( "verbose" ) > 0;
        const auto toStdout = parsedArgs.count( "stdout" ) > 0;
        std::string outputFilePath;
        if ( parsedArgs.count( "output" ) > 0 ) {
            outputFilePath = parsedArgs["output"].as<std::string>();
        }

        const auto t0 = now();

        if ( parsedArgs.count( "compress" ) > 0 ) {
            if ( ( parsedArgs.count( "decompress" ) > 0 ) || ( parsedArgs.count( "range" ) > 0 ) ) {
                std::cerr << "Compression can't be combined with decompression options!\n";
                return 1;
            }

            if ( outputFilePath.empty() && !toStdout ) {
                outputFilePath = inputFilePath + ".zst";
            }

            SeekableEncoder::Options encoderOptions;
            encoderOptions.frameSize = parsedArgs["frame-size"].as<size_t>();
            encoderOptions.compressionLevel = parsedArgs["level"].as<int>();

            const auto nBytesWritten = compress( inputFilePath, openOutput( toStdout ? "" : outputFilePath, force ),
                                                 encoderOptions );
            if ( verbose ) {
                std::cerr << "Compressed to " << nBytesWritten << " B in " << duration( t0, now() ) << " s\n";
            }
            return 0;
        }

        ParallelZstdReader reader( inputFilePath, parsedArgs["decoder-parallelism"].as<unsigned int>() );
        reader.setVerbose( verbose );

        if ( verbose ) {
            std::cerr << "Parallelism: " << reader.parallelism() << "\n";
        }

        if ( parsedArgs.count( "info" ) > 0 ) {
            std::cout << "Decompressed size: " << reader.size() << " B\n"
                      << "Frames: " << reader.frameCount() << "\n";
            if ( verbose ) {
                const RangeDecoder decoder( inputFilePath );
                for ( size_t i = 0; i < decoder.frameCount(); ++i ) {
                    std::cout << decoder.seekTable().frameInfo( i );
                }
            }
            return 0;
        }

        if ( parsedArgs.count( "list-offsets" ) > 0 ) {
            for ( const auto& [encodedOffset, decodedOffset] : reader.frameOffsets() ) {
                std::cout << encodedOffset << "," << decodedOffset << "\n";
            }
            return 0;
        }

        std::vector<ParallelZstdReader::Range> ranges;
        if ( parsedArgs.count( "range" ) > 0 ) {
            for ( const auto& rangeString : parsedArgs["range"].as<std::vector<std::string> >() ) {
                ranges.emplace_back( parseRange( rangeString ) );
            }
        }

        const auto output = openOutput( toStdout ? "" : outputFilePath, force );
        const auto nBytesWritten = decompress( reader, ranges, *output );

        if ( verbose ) {
            std::cerr << "Decompressed " << nBytesWritten << " B in " << duration( t0, now() ) << " s\n";
        }
    } catch ( const SeekableError& exception ) {
        std::cerr << "[" << toString( exception.code() ) << "] " << exception.what() << "\n";
        return 1;
    } catch ( const std::exception& exception ) {
        std::cerr << exception.what() << "\n";
        return 1;
    }

    return 0;
}
