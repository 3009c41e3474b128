#include "Painter.hpp"
#include "Log.hpp"
#include "thread-pool.hpp"

#include <boost/bind/bind.hpp>
#include <boost/ref.hpp>
#include <stdexcept>

std::vector<Chunk>
SplitChunks(std::size_t _count, std::size_t _chunks)
{
    std::vector<Chunk> _result;
    if (!_count) return _result;

    if (!_chunks) _chunks = 1;
    if (_chunks > _count) _chunks = _count;

    std::size_t _size = _count / _chunks;
    for (std::size_t i = 0; i < _chunks; ++i) {
        std::size_t _begin = i * _size;
        std::size_t _end = (i + 1 == _chunks) ? _count : _begin + _size;
        _result.push_back(Chunk(_begin, _end));
    }

    return _result;
}

std::size_t
ProducerThreadCount(std::size_t _chunks)
{
    std::size_t _cores = boost::thread::hardware_concurrency();
    if (!_cores) _cores = 1;

    std::size_t _cap = _cores * PRODUCER_THREADS_PER_CORE;
    if (_chunks < _cap) return _chunks ? _chunks : 1;
    return _cap;
}

Painter::Painter(DispatcherPtr _dispatcher, std::size_t _chunks) :
    m_dispatcher(_dispatcher),
    m_chunks(_chunks ? _chunks : 1),
    m_ran(false)
{
    if (!m_dispatcher.get())
        throw std::invalid_argument("painter needs a dispatcher");
}

Vec2
Painter::QueryCanvas()
{
    return m_dispatcher->QuerySize();
}

void
Painter::_PaintChunk(const std::vector<Pixel> &_pixels, Chunk _chunk)
{
    for (std::size_t i = _chunk.first; i < _chunk.second; ++i)
        m_dispatcher->Submit(SetPixelCommand(_pixels[i].position, _pixels[i].color));
}

PaintReport
Painter::Run(const std::vector<Pixel> &_pixels)
{
    // producers must never meet a finished dispatcher
    if (m_ran)
        throw std::logic_error("painter can run only once");
    m_ran = true;

    switch (m_dispatcher->Mode()) {
    case POOLED_DISPATCH: {
        std::vector<Chunk> _chunks = SplitChunks(_pixels.size(), m_chunks);
        if (!_chunks.empty()) {
            ThreadPool _producers(ProducerThreadCount(_chunks.size()));
            LogInfo("sending (chunks: %zu, chunk size: %zu, threads: %zu)...",
                    _chunks.size(), _chunks[0].second - _chunks[0].first,
                    _producers.ThreadCount());

            for (std::size_t i = 0; i < _chunks.size(); ++i)
                _producers.Post(boost::bind(&Painter::_PaintChunk, this,
                                            boost::cref(_pixels), _chunks[i]));
            // wait for all chunks to finish submitting pixels
            _producers.Join();
        }
        break;
    }
    case BOUNDED_DISPATCH:
        LogInfo("sending (%zu pixels over one connection)...", _pixels.size());
        _PaintChunk(_pixels, Chunk(0, _pixels.size()));
        break;
    }

    m_dispatcher->Finish();

    PaintReport _report;
    _report.pixels = _pixels.size();
    _report.failed = m_dispatcher->FailedCount();
    return _report;
}
