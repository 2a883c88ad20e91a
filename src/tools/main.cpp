/*
 * main.cpp
 *
 * loadopts-dump: prints the effective run options as JSON.
 *
 * Usage: loadopts-dump [options.json]
 *
 *   - Starts from the compiled-in defaults
 *   - Applies the given JSON file, if any
 *   - Applies K6_* environment variables
 *   - Writes the merged options to stdout
 *
 * LOADOPTS_LOG_LEVEL (debug, info, warning, error) controls log verbosity.
 * Any decode or binding failure is logged and the process exits with 1.
 */

#include <exception>
#include <iostream>

#include "loadopts/errors.hpp"
#include "loadopts/json.hpp"
#include "loadopts/load.hpp"
#include "util/logger.hpp"

int main(int argc, char** argv)
{
    using namespace loadopts;

    if (argc > 2)
    {
        std::cerr << "usage: " << argv[0] << " [options.json]\n";
        return 2;
    }

    LoadSources sources;
    sources.environment = Environment::from_process();
    if (argc == 2)
        sources.file_path = argv[1];

    if (const std::string* level_name = sources.environment->lookup("LOADOPTS_LOG_LEVEL"))
    {
        util::LogLevel level = util::LogLevel::Warning;
        if (util::parse_level(*level_name, level))
            util::set_level(level);
        else
            util::warning("ignoring unknown LOADOPTS_LOG_LEVEL \"{}\"", *level_name);
    }

    try
    {
        const Options opts = load_options(sources);
        std::cout << json::encode(opts) << std::endl;
        return 0;
    }
    catch (const BindingError& ex)
    {
        util::error("environment: {}", ex.what());
    }
    catch (const std::exception& ex)
    {
        util::error("loadopts-dump: {}", ex.what());
    }
    return 1;
}
