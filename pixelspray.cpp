#include "Dispatcher.hpp"
#include "Errors.hpp"
#include "ImageSource.hpp"
#include "Log.hpp"
#include "Options.hpp"
#include "Painter.hpp"

#include <boost/asio.hpp>
#include <boost/program_options/errors.hpp>
#include <boost/shared_ptr.hpp>

#include <cstdio>
#include <exception>
#include <string>
#include <vector>

int main(int argc, char **argv)
{
    Options _options = DefaultOptions();

    try {
        if (!ParseOptions(argc, argv, _options))
            return 0;
    } catch (const boost::program_options::error &e) {
        fprintf(stderr, "%s\n", e.what());
        fprintf(stderr, "%s\n", UsageLine(argv[0]).c_str());
        return 2;
    }

    SetLogVerbose(!_options.quiet);

    try {
        boost::shared_ptr<boost::asio::io_service> _io_service(
                new boost::asio::io_service());

        RgbImage _image = LoadImage(_options.image_path);
        LogInfo("opened image, dimensions: %ldx%ld",
                static_cast<long>(_image.width()),
                static_cast<long>(_image.height()));

        if (_options.dispatch.mode == POOLED_DISPATCH)
            LogInfo("connecting (%zu + 1 sockets)...", _options.dispatch.connections);
        else
            LogInfo("connecting (1 socket, %zu in flight)...", _options.dispatch.max_in_flight);

        DispatcherPtr _dispatcher = Dispatcher::Connect(_io_service, _options.dispatch);
        LogInfo("connected.");

        Painter _painter(_dispatcher, _options.chunks);

        Vec2 _canvas = _painter.QueryCanvas();
        LogInfo("canvas: %ux%u (%llu pixels)",
                static_cast<unsigned>(_canvas.x),
                static_cast<unsigned>(_canvas.y),
                static_cast<unsigned long long>(_canvas.x) * _canvas.y);

        std::vector<Pixel> _pixels =
                ImagePixels(StretchToCanvas(_image, _canvas, _options.image));

        PaintReport _report = _painter.Run(_pixels);

        LogInfo("done! (%zu pixels, %zu failed)", _report.pixels, _report.failed);
    } catch (const PixelsprayError &e) {
        LogError("%s", e.what());
        return 1;
    } catch (const std::exception &e) {
        // out of threads, out of memory for a huge canvas, ...
        LogError("fatal: %s", e.what());
        return 1;
    }

    return 0;
}
