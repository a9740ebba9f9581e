/// @file main.cpp
/// @brief Cadence entry point: command line, logging, application lifetime.

#include "core/application.hpp"
#include "core/logger.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out, const po::options_description& options)
{
    out << "Usage: cadence [OPTIONS]...\n"
        << "Beat-synchronized terminal animation. Each beat, the active scenes\n"
        << "write into a layered character canvas and only the changed spans\n"
        << "are sent to the terminal.\n\n"
        << options << '\n';
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    cadence::core::AppConfig app_config;
    cadence::core::LogConfig log_config;

    std::string audio_file;
    std::string log_level = "info";

    po::options_description options("Options");
    options.add_options()
        ("width,W", po::value<cadence::i32>(&app_config.canvas.width)->default_value(app_config.canvas.width),
         "Canvas width in cells (each cell is two terminal columns).")
        ("height,H", po::value<cadence::i32>(&app_config.canvas.height)->default_value(app_config.canvas.height),
         "Canvas height in rows.")
        ("layers,l", po::value<cadence::i32>(&app_config.canvas.layer_count)->default_value(app_config.canvas.layer_count),
         "Number of canvas layers; higher layers draw on top.")
        ("bpm,b", po::value<cadence::f64>(&app_config.bpm)->default_value(app_config.bpm),
         "Tempo in beats per minute.")
        ("beats-per-measure,m", po::value<cadence::i32>(&app_config.beats_per_measure)->default_value(app_config.beats_per_measure),
         "Beats in one measure.")
        ("audio,a", po::value<std::string>(&audio_file),
         "WAV soundtrack to play in sync with the beat clock.")
        ("max-beats,n", po::value<cadence::u64>(&app_config.max_beats)->default_value(app_config.max_beats),
         "Stop after this many drawn beats (0 runs until interrupted or the track ends).")
        ("log-file", po::value<std::string>(&log_config.file_path)->default_value(log_config.file_path),
         "Rotating log file.")
        ("log-level", po::value<std::string>(&log_level)->default_value(log_level),
         "trace, debug, info, warn, err, critical or off.")
        ("help,h", "Print the help message.");

    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(argc, argv).options(options).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        std::cerr << "cadence: " << e.what() << "\n\n";
        print_usage(std::cerr, options);
        return kExitUsage;
    }

    if (vm.count("help"))
    {
        print_usage(std::cout, options);
        return kExitOk;
    }

    log_config.level = spdlog::level::from_str(log_level);
    app_config.audio_path = audio_file;

    cadence::core::Logger::init(log_config);
    CDN_INFO("Cadence starting ({}x{} cells, {} layers)",
             app_config.canvas.width, app_config.canvas.height, app_config.canvas.layer_count);

    int exit_code = kExitOk;
    try
    {
        cadence::core::Application app(app_config);
        app.run();
    }
    catch (const std::invalid_argument& e)
    {
        CDN_CRITICAL("Invalid configuration: {}", e.what());
        std::cerr << "cadence: " << e.what() << '\n';
        exit_code = kExitFailure;
    }

    CDN_INFO("Cadence shut down cleanly");
    cadence::core::Logger::shutdown();
    return exit_code;
}
