#include "Options.hpp"

#include <boost/cstdint.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/random/random_device.hpp>

#include <iostream>
#include <limits>
#include <string>

namespace po = boost::program_options;

namespace {

/*!
 * \brief a count option as size_t
 * \throw po::error if it is below 1 or above _max
 */
std::size_t
_Positive(const po::variables_map &_vm, const char *_name,
          unsigned long long _max = std::numeric_limits<std::size_t>::max())
{
    long long _value = _vm[_name].as<long long>();
    if (_value < 1 || static_cast<unsigned long long>(_value) > _max)
        throw po::error(std::string("--") + _name + " must be between 1 and " +
                        boost::lexical_cast<std::string>(_max));
    return static_cast<std::size_t>(_value);
}

} // namespace

Options
DefaultOptions()
{
    Options _options;
    _options.dispatch = DefaultDispatchConfig();
    _options.image = DefaultImageOptions();
    _options.chunks = 4;
    _options.quiet = false;
    return _options;
}

std::string
UsageLine(const char *_program)
{
    return std::string("usage: ") + _program +
           " --server host:port --stretch-image PATH [options]";
}

bool
ParseOptions(int argc, const char *const argv[], Options &_options)
{
    std::string _mode;

    // counts are read signed so "-1" fails instead of wrapping around
    po::options_description _desc("pixelflut client\n\nOptions");
    _desc.add_options()
        ("help,h", "show this help")
        ("server,s", po::value<std::string>(&_options.dispatch.address)->required(),
         "Pixelflut server to connect to (host:port)")
        ("stretch-image,i", po::value<std::string>(&_options.image_path)->required(),
         "Path to an image (png, ppm) to stretch and paint onto the entire canvas")
        ("connections,c", po::value<long long>()->default_value(4),
         "The number of simultaneous connections used to paint pixels (pooled)")
        ("chunks,k", po::value<long long>()->default_value(4),
         "How many evenly-sized chunks to split the image into and concurrently "
         "schedule pixel paints from (pooled)")
        ("mode,m", po::value<std::string>(&_mode)->default_value("pooled"),
         "Dispatch strategy: pooled or bounded")
        ("jobs,j", po::value<long long>()->default_value(BoundedSender::DEFAULT_MAX_IN_FLIGHT),
         "Max pixel sends in flight over the single connection (bounded)")
        ("threads,t", po::value<long long>()->default_value(BoundedSender::DEFAULT_THREADS),
         "Threads contending for the single connection (bounded)")
        ("queue-capacity", po::value<long long>()->default_value(PooledSender::DEFAULT_QUEUE_CAPACITY),
         "Pixels waiting per connection before producers block (pooled)")
        ("seed", po::value<long long>(),
         "Seed of the connection choice (pooled), random by default")
        ("crunch", po::bool_switch(&_options.image.crunch),
         "Make painted images extremely low quality")
        ("crunch-size", po::value<long long>()->default_value(16),
         "The size to resize images down to when crunching")
        ("quiet,q", po::bool_switch(&_options.quiet),
         "Print errors only");

    po::variables_map _vm;
    po::store(po::parse_command_line(argc, argv, _desc), _vm);

    if (_vm.count("help")) {
        std::cout << UsageLine(argv[0]) << "\n" << _desc << std::endl;
        return false;
    }

    po::notify(_vm);

    if (!ParseDispatchMode(_mode, _options.dispatch.mode))
        throw po::invalid_option_value(_mode);

    _options.dispatch.connections = _Positive(_vm, "connections");
    _options.chunks = _Positive(_vm, "chunks");
    _options.dispatch.max_in_flight = _Positive(_vm, "jobs");
    _options.dispatch.threads = _Positive(_vm, "threads");
    _options.dispatch.queue_capacity = _Positive(_vm, "queue-capacity");
    _options.image.crunch_size = static_cast<boost::uint32_t>(
            _Positive(_vm, "crunch-size", std::numeric_limits<boost::uint32_t>::max()));

    if (_vm.count("seed")) {
        long long _seed = _vm["seed"].as<long long>();
        if (_seed < 0 || _seed > std::numeric_limits<unsigned int>::max())
            throw po::error("--seed must be between 0 and " +
                            boost::lexical_cast<std::string>(
                                    std::numeric_limits<unsigned int>::max()));
        _options.dispatch.seed = static_cast<unsigned int>(_seed);
    } else {
        _options.dispatch.seed = boost::random::random_device()();
    }

    return true;
}
