/**
 * @file report_writer.hpp
 * @brief Render an analysed crate graph as a text table or a JSON document.
 */
#pragma once
#include "cratescope/analysis/pipeline.hpp"
#include "cratescope/common/common.hpp"
#include "cratescope/common/crate_graph.hpp"
#include "cratescope/config/options.hpp"

#include <nlohmann/json.hpp>

namespace cratescope
{

/// Size with binary units, e.g. `512 B`, `1.50 KiB`, `3.20 MiB`.
std::string format_size_binary(size_t bytes);

/// Size with decimal units, e.g. `512 B`, `1.54 kB`, `3.36 MB`.
std::string format_size_decimal(size_t bytes);

/**
 * @brief Build the JSON report.
 *
 * @details
 * Layout:
 * @code
 * {
 *   "root": 0, "std": null,
 *   "metric": {"scheme": "cumulative sum", "gamma": 0.25, "max": 1234} | null,
 *   "nodes": [{"index", "name", "short", "extra", "size", "value", "output",
 *              "features", "highlight"}],
 *   "edges": [{"source", "target", "features"}]
 * }
 * @endcode
 * Nodes are listed in ascending index order. `size` is null for crates missing from the
 * size report; `value`/`output` are absent without a metric, `highlight` without a
 * highlight direction.
 */
nlohmann::json build_json_report(const CrateGraph& graph, const AnalysisResult& result);

/**
 * @brief Write a table of every crate reachable from the root, in depth-first order,
 *        followed by the std node if present.
 */
void write_text_report(std::ostream& os, const CrateGraph& graph, const AnalysisResult& result);

/**
 * @brief Write the report in the requested format.
 */
void write_report(std::ostream& os, const CrateGraph& graph, const AnalysisResult& result, OutputFormat format);

} // namespace cratescope
