/**
 * @file graph_items.cpp
 */
#include "cratescope/common/graph_items.hpp"

namespace cratescope
{

std::string format_features(const FeatureMap& features)
{
    std::string out;
    for (const auto& [name, enabled] : features)
    {
        if (!out.empty())
        {
            out += ",\n";
        }
        out += name;
        if (enabled.empty())
        {
            continue;
        }
        out += '(';
        for (size_t i = 0; i < enabled.size(); ++i)
        {
            if (i > 0)
            {
                out += ',';
            }
            out += enabled[i];
        }
        out += ')';
    }
    return out;
}

} // namespace cratescope
