/**
 * @file size_table.hpp
 */
#pragma once
#include "cratescope/common/common.hpp"

namespace cratescope
{

/**
 * @brief Per-crate byte sizes keyed by short name.
 *
 * @details
 * A `SizeTable` is read from a size report of the form
 * `{"crates": [{"name": "serde", "size": 12345}, ...]}`; any other top-level keys are
 * ignored. Names are the underscore-normalized short names that compiled artifacts use,
 * so several versions of the same package share one entry.
 *
 * Because a single entry aggregates every version, `normalize()` splits each entry
 * evenly across the nodes sharing its short name. This is an approximation; the size
 * report does not distinguish versions.
 */
class SizeTable
{
public:
    SizeTable() = default;

    /**
     * @brief Parse a size report.
     * @param json_text The report text.
     * @throw CrateGraphError with `MalformedSizeReport` if the text is not JSON, lacks a
     *        `crates` array, or an entry lacks a string `name` or a non-negative integer
     *        `size`.
     */
    static SizeTable parse(std::string_view json_text);

    /**
     * @brief Set the size of a short name, replacing any previous value.
     */
    void set(const std::string& short_name, size_t size);

    /**
     * @brief Look up the size of a short name.
     * @return The size, or `std::nullopt` if the name is not in the table.
     */
    std::optional<size_t> lookup(std::string_view short_name) const;

    /**
     * @brief Add the size recorded under `from` to the entry of `to`.
     *
     * @details
     * Used when the analysed binary is named differently from its crate: the report
     * then lists the binary's own code under the binary name. A missing `from` adds
     * nothing; a missing `to` is created. Merging a name into itself does nothing.
     */
    void merge_into(const std::string& from, const std::string& to);

    /**
     * @brief Divide each entry by the number of nodes sharing its short name.
     * @param counts Number of nodes per short name. Names absent from `counts` are
     *        divided by 1.
     * @note Integer division; remainders are dropped.
     */
    void normalize(const std::unordered_map<std::string, size_t>& counts);

    size_t size() const noexcept
    {
        return m_sizes.size();
    }

    bool empty() const noexcept
    {
        return m_sizes.empty();
    }

private:
    std::unordered_map<std::string, size_t> m_sizes;
};

} // namespace cratescope
