#include "ImageSource.hpp"
#include "Errors.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <boost/gil/extension/io/png.hpp>
#include <boost/gil/extension/io/pnm.hpp>
#include <boost/gil/extension/numeric/resample.hpp>
#include <boost/gil/extension/numeric/sampler.hpp>

#include <exception>
#include <stdexcept>

namespace {

template <typename Sampler>
RgbImage
_Resize(const RgbImage &_src,
        boost::uint32_t _width,
        boost::uint32_t _height,
        const Sampler &_sampler)
{
    // samplers leave pixels mapped outside the source untouched
    RgbImage _dst(_width, _height, boost::gil::rgb8_pixel_t(0, 0, 0), 0);
    boost::gil::resize_view(boost::gil::const_view(_src),
                            boost::gil::view(_dst),
                            _sampler);
    return _dst;
}

} // namespace

ImageOptions
DefaultImageOptions()
{
    ImageOptions _options;
    _options.crunch = false;
    _options.crunch_size = 16;
    return _options;
}

RgbImage
LoadImage(const std::string &_path)
{
    RgbImage _image;

    try {
        if (boost::algorithm::iends_with(_path, ".png")) {
            boost::gil::read_and_convert_image(_path, _image, boost::gil::png_tag());
        } else if (boost::algorithm::iends_with(_path, ".ppm") ||
                   boost::algorithm::iends_with(_path, ".pnm") ||
                   boost::algorithm::iends_with(_path, ".pgm") ||
                   boost::algorithm::iends_with(_path, ".pbm")) {
            boost::gil::read_and_convert_image(_path, _image, boost::gil::pnm_tag());
        } else {
            throw ImageError("unsupported image format: " + _path +
                             " (expected .png, .ppm, .pnm, .pgm or .pbm)");
        }
    } catch (const ImageError &) {
        throw;
    } catch (const std::exception &e) {
        throw ImageError("failed to open image " + _path + ": " + e.what());
    }

    if (_image.width() <= 0 || _image.height() <= 0)
        throw ImageError("image " + _path + " is empty");

    return _image;
}

RgbImage
StretchToCanvas(const RgbImage &_image,
                const Vec2 &_canvas,
                const ImageOptions &_options)
{
    if (!_canvas.x || !_canvas.y)
        throw std::invalid_argument("canvas is empty");

    if (!_options.crunch)
        return _Resize(_image, _canvas.x, _canvas.y, boost::gil::bilinear_sampler());

    if (!_options.crunch_size)
        throw std::invalid_argument("crunch size must be positive");

    RgbImage _crunched = _Resize(_image, _options.crunch_size, _options.crunch_size,
                                 boost::gil::nearest_neighbor_sampler());
    return _Resize(_crunched, _canvas.x, _canvas.y,
                   boost::gil::nearest_neighbor_sampler());
}

std::vector<Pixel>
ImagePixels(const RgbImage &_image)
{
    RgbImage::const_view_t _view = boost::gil::const_view(_image);
    std::vector<Pixel> _pixels;
    _pixels.reserve(static_cast<std::size_t>(_view.width()) * _view.height());

    for (std::ptrdiff_t y = 0; y < _view.height(); ++y) {
        RgbImage::const_view_t::x_iterator _it = _view.row_begin(y);
        for (std::ptrdiff_t x = 0; x < _view.width(); ++x, ++_it) {
            Pixel _pixel;
            _pixel.position = MakeVec2(static_cast<boost::uint32_t>(x),
                                       static_cast<boost::uint32_t>(y));
            _pixel.color = MakeRgb(boost::gil::at_c<0>(*_it),
                                   boost::gil::at_c<1>(*_it),
                                   boost::gil::at_c<2>(*_it));
            _pixels.push_back(_pixel);
        }
    }

    return _pixels;
}
