#include "Errors.hpp"
#include "ImageSource.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

// binary ppm: width x height, pixel i gets (i, 2i, 255 - i)
std::string
WritePpm(const std::string &_name, int _width, int _height)
{
    std::string _path = testing::TempDir() + _name;
    std::ofstream _out(_path.c_str(), std::ios::binary);
    _out << "P6\n" << _width << " " << _height << "\n255\n";
    for (int i = 0; i < _width * _height; ++i) {
        _out.put(static_cast<char>(i));
        _out.put(static_cast<char>(2 * i));
        _out.put(static_cast<char>(255 - i));
    }
    return _path;
}

} // namespace

TEST(ImageSourceTest, LoadsPpm)
{
    std::string _path = WritePpm("pixelspray_load.ppm", 3, 2);
    RgbImage _image = LoadImage(_path);
    std::remove(_path.c_str());

    ASSERT_EQ(3, _image.width());
    ASSERT_EQ(2, _image.height());

    std::vector<Pixel> _pixels = ImagePixels(_image);
    ASSERT_EQ(6u, _pixels.size());
    for (unsigned i = 0; i < 6; ++i) {
        EXPECT_EQ(MakeVec2(i % 3, i / 3), _pixels[i].position) << i;
        EXPECT_EQ(MakeRgb(i, 2 * i, 255 - i), _pixels[i].color) << i;
    }
}

TEST(ImageSourceTest, RejectsUnknownFormat)
{
    EXPECT_THROW(LoadImage("picture.gif"), ImageError);
}

TEST(ImageSourceTest, MissingFileThrows)
{
    EXPECT_THROW(LoadImage(testing::TempDir() + "pixelspray_missing.ppm"), ImageError);
    EXPECT_THROW(LoadImage(testing::TempDir() + "pixelspray_missing.png"), ImageError);
}

TEST(ImageSourceTest, StretchesToCanvas)
{
    std::string _path = WritePpm("pixelspray_stretch.ppm", 4, 4);
    RgbImage _image = LoadImage(_path);
    std::remove(_path.c_str());

    RgbImage _stretched = StretchToCanvas(_image, MakeVec2(10, 7), DefaultImageOptions());
    EXPECT_EQ(10, _stretched.width());
    EXPECT_EQ(7, _stretched.height());

    std::vector<Pixel> _pixels = ImagePixels(_stretched);
    ASSERT_EQ(70u, _pixels.size());
    EXPECT_EQ(MakeVec2(0, 0), _pixels.front().position);
    EXPECT_EQ(MakeVec2(9, 6), _pixels.back().position);
}

TEST(ImageSourceTest, CrunchingKeepsFewColors)
{
    std::string _path = WritePpm("pixelspray_crunch.ppm", 8, 8);
    RgbImage _image = LoadImage(_path);
    std::remove(_path.c_str());

    ImageOptions _options = DefaultImageOptions();
    _options.crunch = true;
    _options.crunch_size = 2;

    std::vector<Pixel> _pixels = ImagePixels(StretchToCanvas(_image, MakeVec2(6, 6), _options));
    ASSERT_EQ(36u, _pixels.size());

    // a 2x2 image blown up: four colors at most
    std::vector<Rgb> _colors;
    for (std::size_t i = 0; i < _pixels.size(); ++i) {
        bool _seen = false;
        for (std::size_t c = 0; c < _colors.size(); ++c)
            _seen = _seen || _colors[c] == _pixels[i].color;
        if (!_seen)
            _colors.push_back(_pixels[i].color);
    }
    EXPECT_LE(_colors.size(), 4u);
    EXPECT_GT(_colors.size(), 1u);
}

TEST(ImageSourceTest, RejectsEmptyCanvas)
{
    RgbImage _image(2, 2);
    EXPECT_THROW(StretchToCanvas(_image, MakeVec2(0, 5), DefaultImageOptions()),
                 std::invalid_argument);

    ImageOptions _options = DefaultImageOptions();
    _options.crunch = true;
    _options.crunch_size = 0;
    EXPECT_THROW(StretchToCanvas(_image, MakeVec2(5, 5), _options), std::invalid_argument);
}
