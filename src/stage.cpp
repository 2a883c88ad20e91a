#include "loadopts/stage.hpp"

#include <cstdint>

#include "loadopts/errors.hpp"
#include "util/text.hpp"

namespace loadopts
{
    std::vector<Stage> parse_stages(std::string_view text)
    {
        std::vector<Stage> stages;
        text = util::trim(text);
        if (text.empty())
            return stages;

        for (auto segment : util::split(text, ','))
        {
            segment = util::trim(segment);
            if (segment.empty())
                throw ParseError("invalid stage \"\": empty segment");

            Stage stage;
            const auto colon = segment.find(':');
            const auto duration_text = segment.substr(0, colon);
            try
            {
                stage.duration = parse_duration(duration_text);
            }
            catch (const ParseError& ex)
            {
                throw ParseError("invalid stage \"" + std::string(segment) + "\": " + ex.what());
            }

            if (colon != std::string_view::npos)
            {
                std::int64_t target = 0;
                if (!util::parse_int64(segment.substr(colon + 1), target))
                    throw ParseError("invalid stage \"" + std::string(segment) + "\": target is not an integer");
                stage.target = target;
            }

            stages.push_back(std::move(stage));
        }
        return stages;
    }

    std::string format_stages(const std::vector<Stage>& stages)
    {
        std::string out;
        for (const auto& stage : stages)
        {
            if (!out.empty())
                out.push_back(',');
            out += format_duration(stage.duration.value_or(Duration::zero()));
            if (stage.target.valid)
                out.append(":").append(std::to_string(stage.target.value));
        }
        return out;
    }

} // namespace loadopts
