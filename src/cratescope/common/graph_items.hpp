/**
 * @file graph_items.hpp
 * @brief Node and edge weights of the crate dependency graph.
 */
#pragma once
#include "cratescope/common/common.hpp"

namespace cratescope
{

/**
 * @brief Ordered mapping from a feature name to the features it directly enables.
 *
 * @details
 * Keys iterate in lexicographic order so that anything rendered from the map is
 * reproducible. Each value list keeps first-seen order and holds no duplicates.
 */
using FeatureMap = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Append `feature` to the list of `key`, creating the key if needed.
 * @return True if the feature was not already present.
 */
inline bool add_feature(FeatureMap& map, const std::string& key, const std::string& feature)
{
    auto& list = map[key];
    if (std::find(list.begin(), list.end(), feature) != list.end())
    {
        return false;
    }
    list.push_back(feature);
    return true;
}

/**
 * @brief Render a feature map as `name(sub,sub)` entries separated by ",\n".
 *
 * @details
 * A feature that enables nothing renders as its bare name. An empty map renders as an
 * empty string.
 */
std::string format_features(const FeatureMap& features);

/**
 * @brief The weight of a node, representing one crate (one version of a package).
 *
 * @details
 * The full name is the short name followed by a single space and the extra text
 * (version and optionally a path or registry suffix), e.g. `serde_json v1.0.140`.
 * Hyphens in the short name are already rewritten to underscores, matching the names
 * used by compiled artifacts and therefore by the size report. The extra text is kept
 * verbatim.
 */
class NodeWeight
{
public:
    NodeWeight(std::string full_name, size_t short_end, FeatureMap features = {})
        : m_name(std::move(full_name))
        , m_short_end(std::min(short_end, m_name.size()))
        , m_features(std::move(features))
    {
    }

    /// Short name of the crate, e.g. `serde_json`.
    std::string_view short_name() const noexcept
    {
        return std::string_view(m_name).substr(0, m_short_end);
    }

    /// Version and path suffix, e.g. `v1.0.140`; empty for the std node.
    std::string_view extra() const noexcept
    {
        if (m_short_end + 1 >= m_name.size())
        {
            return {};
        }
        return std::string_view(m_name).substr(m_short_end + 1);
    }

    /// Full name, e.g. `serde_json v1.0.140`.
    const std::string& full() const noexcept
    {
        return m_name;
    }

    /**
     * @brief Features enabled on this crate, each mapped to the features it enables.
     *
     * @details
     * For a crate with `default = ["a", "b"]`, `a = ["c"]` where everything is enabled,
     * the map is `{a: [c], b: [], c: [], default: [a, b]}`. Features of dependencies
     * enabled by this crate are recorded on the outgoing `EdgeWeight` instead.
     */
    const FeatureMap& features() const noexcept
    {
        return m_features;
    }

    FeatureMap& features() noexcept
    {
        return m_features;
    }

private:
    std::string m_name;
    size_t m_short_end;
    FeatureMap m_features;
};

/**
 * @brief The weight of an edge `source -> target` (source depends on target).
 *
 * @details
 * `features` maps a feature of the source crate to the features of the target crate it
 * enables. For `a = ["dep/b", "dep/c"]` on the source, the map is `{a: [b, c]}`.
 */
struct EdgeWeight
{
    FeatureMap features;
};

} // namespace cratescope
