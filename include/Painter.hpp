#ifndef PAINTER_HPP
#define PAINTER_HPP

#include "Command.hpp"
#include "Dispatcher.hpp"

#include <cstddef>
#include <utility>
#include <vector>

/// outcome of Painter::Run
typedef struct _PaintReport {
    /// pixels submitted
    std::size_t pixels;
    /// pixels whose send failed
    std::size_t failed;
} PaintReport;

/// [begin, end) indices into the pixel sequence
typedef std::pair<std::size_t, std::size_t> Chunk;

/*!
 * \brief split _count pixels into _chunks contiguous chunks of
 * _count / _chunks pixels, the last one taking the remainder.
 * _chunks is clamped to [1, _count]; no chunks for an empty sequence
 */
std::vector<Chunk> SplitChunks(std::size_t _count, std::size_t _chunks);

/// producer threads per hardware thread
const std::size_t PRODUCER_THREADS_PER_CORE = 2;

/*!
 * \brief threads running _chunks producers: one per chunk, at most
 * PRODUCER_THREADS_PER_CORE per hardware thread; extra chunks wait
 * in the pool queue
 */
std::size_t ProducerThreadCount(std::size_t _chunks);

/*!
 * \brief The Painter class paints a pixel sequence through a Dispatcher
 * pooled: _chunks producers on a capped thread pool, each submitting
 * its chunk in order
 * bounded: the calling thread submits everything in order
 * a Dispatcher can paint only once, Run finishes it
 */
class Painter {
public:
    Painter(DispatcherPtr _dispatcher, std::size_t _chunks);

    /*!
     * \brief canvas size from the dispatcher's designated connection
     * \throw IoError, ProtocolError
     */
    Vec2 QueryCanvas();

    /*!
     * \brief submit every pixel and wait until the dispatcher drained
     * per-pixel failures are counted in the report, never thrown
     * \throw std::logic_error on a second call
     */
    PaintReport Run(const std::vector<Pixel> &_pixels);

protected:
    /// producer loop over one chunk
    void _PaintChunk(const std::vector<Pixel> &_pixels, Chunk _chunk);

    DispatcherPtr m_dispatcher;
    std::size_t m_chunks;
    /// set by Run
    bool m_ran;
};

#endif // PAINTER_HPP
