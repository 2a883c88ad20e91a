#include "loadopts/load.hpp"

#include <fstream>
#include <sstream>

#include "loadopts/errors.hpp"
#include "loadopts/json.hpp"
#include "util/logger.hpp"

namespace loadopts
{
    Options load_options_file(const std::string& path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
            throw Error("cannot open options file: " + path);

        std::ostringstream buffer;
        buffer << in.rdbuf();
        if (in.bad())
            throw Error("cannot read options file: " + path);

        try
        {
            return json::decode(buffer.str());
        }
        catch (const DecodeError& ex)
        {
            throw DecodeError(path + ": " + ex.what());
        }
    }

    Options load_options(const LoadSources& sources)
    {
        Options opts = sources.defaults;

        if (!sources.file_path.empty())
        {
            util::debug("applying options file {}", sources.file_path);
            opts = opts.apply(load_options_file(sources.file_path));
        }

        if (sources.json_text)
        {
            util::debug("applying inline options ({} bytes)", sources.json_text->size());
            opts = opts.apply(json::decode(*sources.json_text));
        }

        if (sources.environment)
        {
            util::debug("applying environment with prefix {}", sources.env_prefix);
            opts = opts.apply(options_from_env(*sources.environment, sources.env_prefix));
        }

        return opts;
    }

} // namespace loadopts
