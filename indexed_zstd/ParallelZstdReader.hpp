#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "Error.hpp"
#include "FileReader.hpp"
#include "RangeDecoder.hpp"
#include "SeekTable.hpp"
#include "ThreadPool.hpp"
#include "common.hpp"


/**
 * Handle to a seekable zstd archive which serves range requests in parallel.
 *
 * The handle itself only stores a reopenable source and the seek table, which are both read-only after
 * construction. Every range request opens its own source handle and decoder, therefore requests never share
 * mutable decoder state and can run concurrently without locking.
 *
 * @note All methods except @ref close may be called from different threads. Closing must not happen
 *       concurrently to other calls.
 */
class ParallelZstdReader
{
public:
    /** [start, end) in decompressed bytes. */
    using Range = std::pair<uint64_t, uint64_t>;

public:
    /**
     * @param file Prototype which is cloned for each request.
     * @param parallelization Number of worker threads for batch reads. 0 means all cores.
     */
    explicit
    ParallelZstdReader( UniqueFileReader file,
                        size_t           parallelization = 0 ) :
        m_file( std::move( file ) ),
        m_seekTable( readMetadata( m_file.get() ) ),
        m_parallelization( parallelization == 0 ? availableCores() : parallelization ),
        m_threadPool( std::make_unique<ThreadPool>( m_parallelization ) )
    {}

    explicit
    ParallelZstdReader( const std::string& filePath,
                        size_t             parallelization = 0 ) :
        ParallelZstdReader( std::make_unique<StandardFileReader>( filePath ), parallelization )
    {}

    explicit
    ParallelZstdReader( SharedBufferFileReader::Buffer buffer,
                        size_t                         parallelization = 0 ) :
        ParallelZstdReader( std::make_unique<SharedBufferFileReader>( std::move( buffer ) ), parallelization )
    {}

    ParallelZstdReader( const ParallelZstdReader& ) = delete;
    ParallelZstdReader& operator=( const ParallelZstdReader& ) = delete;

    /** @return the total decompressed size in bytes. */
    [[nodiscard]] size_t
    size() const
    {
        checkNotClosed();
        return m_seekTable.decodedSize();
    }

    [[nodiscard]] size_t
    frameCount() const
    {
        checkNotClosed();
        return m_seekTable.frameCount();
    }

    [[nodiscard]] size_t
    parallelism() const noexcept
    {
        return m_parallelization;
    }

    /**
     * @return offsets of each frame in the compressed file in bytes mapped to the corresponding offsets in the
     *         decompressed stream. The last entry maps the end of the last frame to the decompressed size.
     */
    [[nodiscard]] std::map<size_t, size_t>
    frameOffsets() const
    {
        checkNotClosed();

        std::map<size_t, size_t> encodedToDecoded;
        for ( size_t i = 0; i < m_seekTable.frameCount(); ++i ) {
            encodedToDecoded.emplace( m_seekTable.frameStartCompressed( i ), m_seekTable.frameStartDecompressed( i ) );
        }
        encodedToDecoded.emplace( m_seekTable.encodedSize(), m_seekTable.decodedSize() );
        return encodedToDecoded;
    }

    void
    setVerbose( bool verbose ) noexcept
    {
        m_verbose = verbose;
    }

    /**
     * Reads a single range synchronously on the calling thread.
     */
    [[nodiscard]] std::vector<uint8_t>
    readRange( uint64_t start,
               uint64_t end ) const
    {
        checkNotClosed();
        checkRange( { start, end } );
        return decodeRange( { start, end } );
    }

    /**
     * Same as @ref readRange but evaluated on a background thread, so that the caller is not blocked.
     * The reader must not be closed or destroyed before the returned future is ready.
     */
    [[nodiscard]] std::future<std::vector<uint8_t> >
    readRangeAsync( uint64_t start,
                    uint64_t end ) const
    {
        checkNotClosed();
        return std::async( std::launch::async, [this, start, end] () { return readRange( start, end ); } );
    }

    /**
     * Reads all ranges in parallel. The results are returned in the same order as the requested ranges.
     * If any of the requests fails, the whole batch fails with the error of the first failed request
     * and all other results are discarded.
     */
    [[nodiscard]] std::vector<std::vector<uint8_t> >
    readRanges( const std::vector<Range>& ranges ) const
    {
        checkNotClosed();

        /* Reject invalid requests before any decoding work is started. */
        for ( const auto& range : ranges ) {
            checkRange( range );
        }

        const auto tStart = now();

        /* Tasks which did not start yet when another one failed can skip their work because the batch failed anyway.
         * This is local to the batch and all tasks will have finished before it goes out of scope. */
        std::atomic<bool> batchFailed{ false };

        std::vector<std::future<std::vector<uint8_t> > > futures;
        futures.reserve( ranges.size() );
        try {
            for ( const auto& range : ranges ) {
                futures.emplace_back( m_threadPool->submitTask(
                    [this, range, &batchFailed] () -> std::vector<uint8_t> {
                        if ( batchFailed ) {
                            return {};
                        }
                        try {
                            return decodeRange( range );
                        } catch ( ... ) {
                            batchFailed = true;
                            throw;
                        }
                    } ) );
            }
        } catch ( ... ) {
            /* Already queued tasks reference batchFailed, so they have to finish before it goes out of scope. */
            batchFailed = true;
            for ( auto& future : futures ) {
                future.wait();
            }
            throw;
        }

        /* Always wait for all futures. Leaving tasks running which reference batchFailed would be fatal. */
        std::vector<std::vector<uint8_t> > results;
        results.reserve( ranges.size() );
        std::exception_ptr firstError;
        for ( auto& future : futures ) {
            try {
                results.emplace_back( future.get() );
            } catch ( ... ) {
                if ( !firstError ) {
                    firstError = std::current_exception();
                }
            }
        }

        if ( firstError ) {
            if ( m_verbose ) {
                std::cerr << ( ThreadSafeOutput() << "[ParallelZstdReader] Batch of" << ranges.size()
                               << "ranges failed" ).str();
            }
            std::rethrow_exception( firstError );
        }

        if ( m_verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[ParallelZstdReader] Read" << ranges.size() << "ranges in"
                           << duration( tStart, now() ) << "s" ).str();
        }

        return results;
    }

    /**
     * Releases the source and the worker threads. All further calls will throw ClosedError.
     */
    void
    close()
    {
        if ( m_closed.exchange( true ) ) {
            return;
        }

        m_threadPool.reset();
        m_file->close();
    }

    [[nodiscard]] bool
    closed() const noexcept
    {
        return m_closed;
    }

private:
    [[nodiscard]] static size_t
    availableCores()
    {
        return std::max<size_t>( 1, std::thread::hardware_concurrency() );
    }

    [[nodiscard]] static seekable::SeekTable
    readMetadata( const FileReader* file )
    {
        if ( file == nullptr ) {
            throw std::invalid_argument( "May not give invalid pointers as arguments!" );
        }
        return RangeDecoder( file->clone() ).seekTable();
    }

    static void
    checkRange( const Range& range )
    {
        if ( range.second < range.first ) {
            std::stringstream msg;
            msg << "End offset cannot be less than start offset (" << range.first << " > " << range.second << ")";
            throw FormatError( msg.str() );
        }
    }

    void
    checkNotClosed() const
    {
        if ( m_closed ) {
            throw ClosedError();
        }
    }

    /**
     * Opens a new source handle and decoder for each call so that it can be called from any thread.
     */
    [[nodiscard]] std::vector<uint8_t>
    decodeRange( const Range& range ) const
    {
        if ( range.first == range.second ) {
            return {};
        }

        if ( m_verbose ) {
            std::cerr << ( ThreadSafeOutput() << "[ParallelZstdReader] Decode range" << range ).str();
        }

        RangeDecoder decoder( m_file->clone() );
        return decoder.readRange( range.first, range.second );
    }

private:
    const UniqueFileReader m_file;
    const seekable::SeekTable m_seekTable;
    const size_t m_parallelization;

    std::unique_ptr<ThreadPool> m_threadPool;
    std::atomic<bool> m_closed{ false };
    std::atomic<bool> m_verbose{ false };
};
