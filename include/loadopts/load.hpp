#pragma once

#include <optional>
#include <string>

#include "loadopts/env.hpp"
#include "loadopts/options.hpp"

namespace loadopts
{
    struct LoadSources
    {
        Options defaults = default_options();
        std::string file_path;                 // JSON options file; empty = none
        std::optional<std::string> json_text;  // inline JSON, e.g. exported by a script
        std::optional<Environment> environment; // nullopt = skip environment
        std::string env_prefix = std::string(kDefaultEnvPrefix);
    };

    /// defaults -> file -> inline JSON -> environment, later sources winning.
    Options load_options(const LoadSources& sources);

    /// Reads and decodes a JSON options file. Throws Error when unreadable.
    Options load_options_file(const std::string& path);

} // namespace loadopts
