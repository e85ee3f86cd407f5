/**
 * @file size_table.cpp
 */
#include "cratescope/common/size_table.hpp"
#include "cratescope/common/graph_exceptions.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cratescope
{

SizeTable SizeTable::parse(std::string_view json_text)
{
    using json = nlohmann::json;

    json report;
    try
    {
        report = json::parse(json_text.begin(), json_text.end());
    }
    catch (const json::parse_error& e)
    {
        throw CrateGraphError(
            CrateGraphErrorCode::MalformedSizeReport,
            std::string("Size report is not valid JSON: ") + e.what());
    }

    const auto crates_it = report.find("crates");
    if (!report.is_object() || crates_it == report.end() || !crates_it->is_array())
    {
        throw CrateGraphError(
            CrateGraphErrorCode::MalformedSizeReport,
            "Size report has no \"crates\" array");
    }

    SizeTable table;
    size_t position = 0;
    for (const auto& entry : *crates_it)
    {
        const auto name_it = entry.is_object() ? entry.find("name") : entry.end();
        const auto size_it = entry.is_object() ? entry.find("size") : entry.end();
        if (name_it == entry.end() || !name_it->is_string())
        {
            throw CrateGraphError(
                CrateGraphErrorCode::MalformedSizeReport,
                "Size report entry " + std::to_string(position) + " has no string \"name\"");
        }
        if (size_it == entry.end() || !size_it->is_number_unsigned())
        {
            throw CrateGraphError(
                CrateGraphErrorCode::MalformedSizeReport,
                "Size report entry " + std::to_string(position) + " (" +
                    name_it->get<std::string>() + ") has no non-negative integer \"size\"");
        }
        table.set(name_it->get<std::string>(), size_it->get<size_t>());
        ++position;
    }

    spdlog::debug("Read {} size entries", table.size());
    return table;
}

void SizeTable::set(const std::string& short_name, size_t size)
{
    m_sizes[short_name] = size;
}

std::optional<size_t> SizeTable::lookup(std::string_view short_name) const
{
    auto it = m_sizes.find(std::string(short_name));
    if (it == m_sizes.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void SizeTable::merge_into(const std::string& from, const std::string& to)
{
    if (from == to)
    {
        return;
    }
    auto from_it = m_sizes.find(from);
    size_t amount = from_it == m_sizes.end() ? 0 : from_it->second;
    m_sizes[to] += amount;
}

void SizeTable::normalize(const std::unordered_map<std::string, size_t>& counts)
{
    for (auto& [name, size] : m_sizes)
    {
        auto it = counts.find(name);
        size_t count = (it == counts.end() || it->second == 0) ? 1 : it->second;
        size /= count;
    }
}

} // namespace cratescope
