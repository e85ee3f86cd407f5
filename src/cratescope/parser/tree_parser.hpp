/**
 * @file tree_parser.hpp
 * @brief TreeParser turns a depth-prefixed dependency tree listing into a CrateGraph.
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/crate_graph.hpp"

namespace cratescope
{

/**
 * @brief Parser for depth-prefixed dependency tree listings with feature edges.
 *
 * @details
 * The input is the output of a build tool's tree command with depth prefixes and
 * feature edges enabled (`cargo tree --edges=no-build,no-proc-macro,no-dev,features
 * --prefix=depth --color=never`). Each line is a decimal depth followed by either
 *
 * - a crate entry, `<short-name> <version>[ <path>][ (*)]`, or
 * - a feature entry, `<short-name> feature "<feature>"[ (*)]`.
 *
 * A feature entry is immediately followed, one level deeper, by the crate it belongs
 * to; the features it enables are further feature entries at that same level. A
 * trailing `(*)` marks an entry whose subtree was already printed.
 *
 * @par Example
 * @code
 * 0app v0.1.0
 * 1clap feature "default"
 * 2clap v4.5.0
 * 3clap_builder v4.5.0
 * 2clap feature "color"
 * 3clap v4.5.0 (*)
 * 3clap_builder feature "color"
 * 4clap_builder v4.5.0
 * @endcode
 * yields crates `app`, `clap` and `clap_builder`; edges `app -> clap` and
 * `clap -> clap_builder`; `clap` features `{color: [], default: [color]}`; `clap_builder`
 * features `{color: []}`; and the edge `clap -> clap_builder` with features
 * `{color: [color]}`.
 *
 * @par Algorithm
 * A stack of (crate, active feature) frames holds the current ancestry; a line's depth
 * either descends one level (pushing the previous crate), stays, or returns to an
 * ancestor (truncating the stack). A feature header and its crate line share a single
 * frame. A `(*)` feature entry is resolved through a (short name, feature) table filled
 * when that feature is first expanded, so no subtree is duplicated.
 *
 * @par Errors
 * Parsing stops at the first bad line with a `TreeParseError` naming the line. A listing
 * with no entries at all throws `CrateGraphError` with `EmptyInput`.
 *
 * @par Thread safety
 * Stateless; all parse state is local to `parse()`. Safe to share between threads.
 */
class TreeParser
{
public:
    /**
     * @brief Parse a tree listing into a graph rooted at its depth-0 crate.
     * @param listing The complete listing text; blank lines and `\r` are ignored.
     * @return The graph. Its size table is empty; install one with
     *         `CrateGraph::set_size_table()`.
     * @throw TreeParseError for a malformed line.
     * @throw CrateGraphError with `EmptyInput` if the listing has no entries.
     */
    CrateGraph parse(std::string_view listing) const;
};

} // namespace cratescope
