/**
 * @file tree_parser.cpp
 */
#include "cratescope/parser/tree_parser.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace cratescope
{

namespace
{

constexpr std::string_view k_back_reference_suffix = " (*)";
constexpr std::string_view k_feature_marker = " feature \"";

/**
 * @brief One level of the ancestry stack.
 * @details `feature` is set when the frame was opened by a feature header, and names
 *          the feature of `node` that is active for the children of this frame.
 */
struct Frame
{
    NodeIdx node = 0;
    std::optional<std::string> feature;
};

bool ends_with(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Per-call parse state. Discarded when `parse()` returns.
 */
class ParseState
{
public:
    void feed(size_t line_number, std::string_view line);
    void finish();

    CrateGraph take_graph()
    {
        return std::move(m_graph);
    }

    size_t entry_count() const noexcept
    {
        return m_entries;
    }

private:
    CrateGraph m_graph;

    /// Crate entry text ("short version") -> node.
    std::unordered_map<std::string, NodeIdx> m_crates;

    /// (raw short name, feature) -> node, filled when the feature is first expanded.
    std::map<std::pair<std::string, std::string>, NodeIdx> m_feature_nodes;

    std::vector<Frame> m_stack;
    Frame m_last;
    bool m_has_last = false;
    bool m_seen_root = false;

    /// Set by a feature header until its crate line is consumed.
    bool m_is_feature_first = false;
    size_t m_feature_depth = 0;

    size_t m_entries = 0;
    size_t m_line_number = 0;
    std::string m_line;

    [[noreturn]] void fail(const std::string& reason) const
    {
        throw TreeParseError(m_line_number, m_line, reason);
    }

    void enter_depth(size_t depth);
    void feed_feature(std::string_view entry, size_t marker, bool back_reference);
    void feed_crate(std::string_view entry, size_t depth);
    NodeIdx intern_crate(std::string_view entry);
    void attach(NodeIdx node, const std::optional<std::string>& feature);
};

void ParseState::feed(size_t line_number, std::string_view line)
{
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1);
    }
    if (line.find_first_not_of(" \t") == std::string_view::npos)
    {
        return;
    }

    m_line_number = line_number;
    m_line = std::string(line);
    ++m_entries;

    // "2is-wsl v0.4.0 (*)" / "2is-wsl feature "default""
    size_t digits = 0;
    size_t depth = 0;
    while (digits < line.size() && std::isdigit(static_cast<unsigned char>(line[digits])))
    {
        size_t digit = static_cast<size_t>(line[digits] - '0');
        if (depth > (std::numeric_limits<size_t>::max() - digit) / 10)
        {
            fail("depth prefix out of range");
        }
        depth = depth * 10 + digit;
        ++digits;
    }
    if (digits == 0)
    {
        fail("missing depth prefix");
    }

    std::string_view rest = line.substr(digits);
    if (rest.empty() || !std::isalpha(static_cast<unsigned char>(rest.front())))
    {
        fail("expected a crate name after the depth prefix");
    }

    bool back_reference = ends_with(rest, k_back_reference_suffix);
    std::string_view entry = back_reference ? rest.substr(0, rest.size() - k_back_reference_suffix.size())
                                            : rest;
    size_t marker = entry.find(k_feature_marker);
    bool is_feature = marker != std::string_view::npos;

    if (is_feature && depth == 0)
    {
        fail("root entry must be a crate");
    }

    if (m_is_feature_first)
    {
        if (is_feature || depth != m_feature_depth + 1)
        {
            fail("feature header is not followed by its crate one level deeper");
        }
    }
    else
    {
        enter_depth(depth);
    }

    if (is_feature)
    {
        feed_feature(entry, marker, back_reference);
        if (!back_reference)
        {
            m_is_feature_first = true;
            m_feature_depth = depth;
        }
    }
    else
    {
        feed_crate(entry, depth);
    }
}

void ParseState::enter_depth(size_t depth)
{
    if (depth == 0 && m_seen_root)
    {
        fail("second root entry at depth 0");
    }

    if (depth < m_stack.size())
    {
        m_stack.resize(depth);
    }
    else if (depth == m_stack.size() + 1)
    {
        if (!m_has_last)
        {
            fail("first entry must be at depth 0");
        }
        m_stack.push_back(m_last);
    }
    else if (depth > m_stack.size() + 1)
    {
        fail("depth increases by more than one level");
    }
}

void ParseState::feed_feature(std::string_view entry, size_t marker, bool back_reference)
{
    // "is-wsl feature "default"" -> ("is-wsl", "default")
    size_t name_begin = marker + k_feature_marker.size();
    if (entry.size() <= name_begin || entry.back() != '"')
    {
        fail("unterminated feature name");
    }
    std::string short_name(entry.substr(0, marker));
    std::string feature(entry.substr(name_begin, entry.size() - name_begin - 1));
    if (feature.empty() || feature.find('"') != std::string::npos)
    {
        fail("invalid feature name");
    }

    m_last.feature = feature;

    if (back_reference)
    {
        // |- A feature "i" (*)
        auto it = m_feature_nodes.find(std::make_pair(short_name, feature));
        if (it == m_feature_nodes.end())
        {
            fail("feature back-reference to '" + short_name + "/" + feature + "' was never expanded");
        }
        attach(it->second, m_last.feature);
    }
}

void ParseState::feed_crate(std::string_view entry, size_t depth)
{
    NodeIdx node = intern_crate(entry);
    if (depth == 0)
    {
        m_seen_root = true;
    }

    if (m_is_feature_first)
    {
        const std::string& feature = *m_last.feature;
        std::string short_name(entry.substr(0, entry.find(' ')));
        // A later expansion, e.g. of another version, replaces the earlier one
        m_feature_nodes[std::make_pair(short_name, feature)] = node;

        // A feature "i"
        // |- A
        // Add feature "i" to node A
        FeatureMap& features = m_graph.node_weight(node).features();
        features[feature];

        // A feature "i"
        // |- A
        // |- A feature "j"
        //    |- A
        // Record that "i" enables "j"
        if (!m_stack.empty() && m_stack.back().node == node && m_stack.back().feature)
        {
            add_feature(features, *m_stack.back().feature, feature);
        }
    }
    else
    {
        m_last.feature.reset();
    }

    attach(node, m_last.feature);

    m_last.node = node;
    m_has_last = true;
    if (m_is_feature_first)
    {
        m_stack.push_back(m_last);
        m_last.feature.reset();
    }
    m_is_feature_first = false;
}

NodeIdx ParseState::intern_crate(std::string_view entry)
{
    std::string key(entry);
    auto it = m_crates.find(key);
    if (it != m_crates.end())
    {
        return it->second;
    }

    size_t short_end = entry.find(' ');
    if (short_end == std::string_view::npos)
    {
        fail("missing separator between crate name and version");
    }

    std::string name(entry);
    std::replace(name.begin(), name.begin() + static_cast<std::ptrdiff_t>(short_end), '-', '_');

    NodeIdx node = m_graph.add_node(NodeWeight(std::move(name), short_end));
    m_crates.emplace(std::move(key), node);
    return node;
}

void ParseState::attach(NodeIdx node, const std::optional<std::string>& feature)
{
    if (m_stack.empty() || m_stack.back().node == node)
    {
        return;
    }
    const Frame& parent = m_stack.back();

    EdgeWeight* edge = nullptr;
    try
    {
        edge = &m_graph.add_edge(parent.node, node);
    }
    catch (const CrateGraphError& e)
    {
        fail(e.what());
    }

    // A feature "i"
    // |- A
    // |- B feature "j"
    //    |- B
    // Feature "i" of A enables feature "j" of B
    if (parent.feature)
    {
        if (feature)
        {
            add_feature(edge->features, *parent.feature, *feature);
        }
        else
        {
            spdlog::warn("Line {}: crate '{}' under feature '{}' has no feature of its own",
                         m_line_number, m_line, *parent.feature);
        }
    }
}

void ParseState::finish()
{
    if (m_entries == 0)
    {
        throw CrateGraphError(
            CrateGraphErrorCode::EmptyInput,
            "Tree listing is empty; the build tool did not resolve a single root package");
    }
    if (m_is_feature_first)
    {
        fail("feature header at the end of the listing has no crate");
    }
}

} // namespace

CrateGraph TreeParser::parse(std::string_view listing) const
{
    ParseState state;

    size_t line_number = 0;
    size_t begin = 0;
    while (begin <= listing.size())
    {
        size_t end = listing.find('\n', begin);
        if (end == std::string_view::npos)
        {
            end = listing.size();
        }
        state.feed(++line_number, listing.substr(begin, end - begin));
        begin = end + 1;
    }
    state.finish();

    CrateGraph graph = state.take_graph();
    spdlog::debug("Parsed {} entries into {} crates and {} edges",
                  state.entry_count(), graph.node_count(), graph.edge_count());
    return graph;
}

} // namespace cratescope
