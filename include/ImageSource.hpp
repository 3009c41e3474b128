#ifndef IMAGESOURCE_HPP
#define IMAGESOURCE_HPP

#include "Command.hpp"

#include <boost/cstdint.hpp>
#include <boost/gil.hpp>
#include <string>
#include <vector>

/// decoded image, 8 bits per channel rgb
typedef boost::gil::rgb8_image_t RgbImage;

/// how the image is fit onto the canvas
typedef struct _ImageOptions {
    /// make painted images extremely low quality
    bool crunch;
    /// the size to resize images down to when crunching
    boost::uint32_t crunch_size;
} ImageOptions;

/// no crunching, crunch size 16
ImageOptions DefaultImageOptions();

/*!
 * \brief read a png or pnm (ppm/pgm/pbm) file, converting it to rgb8
 * \throw ImageError
 */
RgbImage LoadImage(const std::string &_path);

/*!
 * \brief resize _image to exactly _canvas
 * crunching first shrinks it to crunch_size x crunch_size, both steps
 * then use nearest neighbour; otherwise one bilinear resize
 * \throw std::invalid_argument on an empty canvas or crunch size 0
 */
RgbImage StretchToCanvas(const RgbImage &_image,
                         const Vec2 &_canvas,
                         const ImageOptions &_options);

/*!
 * \brief every pixel of _image, row by row
 */
std::vector<Pixel> ImagePixels(const RgbImage &_image);

#endif // IMAGESOURCE_HPP
