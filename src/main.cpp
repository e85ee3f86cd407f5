#include "cratescope/analysis/pipeline.hpp"
#include "cratescope/common/logging.hpp"
#include "cratescope/config/options.hpp"
#include "cratescope/report/report_writer.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace
{

std::string read_input(const std::string& path)
{
    if (path == "-")
    {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
    {
        throw std::runtime_error("Cannot open '" + path + "'");
    }
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

} // namespace

int main(int argc, char** argv)
{
    try
    {
        cratescope::CommandLine command_line = cratescope::parse_options(argc, argv);
        if (command_line.help)
        {
            std::cout << command_line.usage << std::flush;
            return EXIT_SUCCESS;
        }
        const cratescope::AnalysisOptions& options = command_line.options;
        cratescope::init_logging(options.log_level);

        std::string tree_text = read_input(options.tree_path);
        std::string size_report_text;
        if (!options.size_report_path.empty())
        {
            size_report_text = read_input(options.size_report_path);
        }

        cratescope::CrateGraph graph =
            cratescope::load_crate_graph(tree_text, size_report_text, options.with_std, options.bin);
        cratescope::AnalysisResult result = cratescope::run_analysis(graph, options);
        cratescope::write_report(std::cout, graph, result, options.format);
        std::cout << std::flush;
    }
    catch (const cratescope::CrateGraphError& e)
    {
        spdlog::error("{}", e.what());
        return e.is_usage_error() ? 2 : EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
