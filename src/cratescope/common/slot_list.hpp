/**
 * @file slot_list.hpp
 */
#pragma once
#include "cratescope/common/common.hpp"

namespace cratescope
{

/**
 * @brief An arena of values addressed by stable indices, with O(1) removal.
 *
 * @details
 * `SlotList<T>` stores values in a `std::vector<std::optional<T>>`. Inserting appends a
 * new slot and returns its index; erasing leaves a tombstone (an empty slot) so that
 * the indices of all other values stay valid. Slots are never reused, so an index that
 * has been erased never comes back to life with a different value.
 *
 * @par Index semantics
 * - Indices are assigned sequentially starting from 0.
 * - `capacity()` is one past the largest index ever assigned; use it to size
 *   index-addressed side tables.
 * - `size()` is the number of live values, which is at most `capacity()`.
 * - The live index range is sparse after any erase; iterate with `indices()` or
 *   `enumerate()`.
 *
 * @par Exception safety
 * - `insert()` provides the strong exception guarantee.
 * - `contains()`, `size()`, `capacity()` and `erase()` are `noexcept`.
 * - `at()` throws `std::out_of_range` for an index that was never assigned or has been
 *   erased.
 *
 * @par Thread safety
 * - No internal synchronization; not thread-safe.
 * - Concurrent reads (const operations) are safe.
 */
template <typename T>
class SlotList
{
public:
    /**
     * @brief Store a value in a new slot.
     * @return The index of the new slot, equal to the previous `capacity()`.
     * @note Complexity: amortized O(1).
     */
    size_t insert(T value)
    {
        size_t index = m_slots.size();
        m_slots.emplace_back(std::move(value));
        ++m_live;
        return index;
    }

    /**
     * @brief Remove the value at the given index, leaving a tombstone.
     * @return True if a live value was removed; false if the index was not live.
     * @note Complexity: O(1).
     */
    bool erase(size_t index) noexcept
    {
        if (!contains(index))
        {
            return false;
        }
        m_slots[index].reset();
        --m_live;
        return true;
    }

    /**
     * @brief Check whether the index refers to a live value.
     */
    bool contains(size_t index) const noexcept
    {
        return index < m_slots.size() && m_slots[index].has_value();
    }

    /**
     * @brief Access the live value at the given index.
     * @throw std::out_of_range if the index is not live.
     */
    T& at(size_t index)
    {
        if (!contains(index))
        {
            throw std::out_of_range("SlotList::at: index " + std::to_string(index) + " is not live");
        }
        return *m_slots[index];
    }

    /**
     * @brief Access the live value at the given index.
     * @throw std::out_of_range if the index is not live.
     */
    const T& at(size_t index) const
    {
        if (!contains(index))
        {
            throw std::out_of_range("SlotList::at: index " + std::to_string(index) + " is not live");
        }
        return *m_slots[index];
    }

    /**
     * @brief Number of live values.
     */
    size_t size() const noexcept
    {
        return m_live;
    }

    /**
     * @brief One past the largest index ever assigned.
     */
    size_t capacity() const noexcept
    {
        return m_slots.size();
    }

    /**
     * @brief Live indices in ascending order.
     * @note Complexity: O(capacity()).
     */
    std::vector<size_t> indices() const
    {
        std::vector<size_t> result;
        result.reserve(m_live);
        for (size_t idx = 0; idx < m_slots.size(); ++idx)
        {
            if (m_slots[idx].has_value())
            {
                result.push_back(idx);
            }
        }
        return result;
    }

    /**
     * @brief Enumerate live values in ascending index order.
     * @tparam Func A callable type with signature `void(size_t, const T&)`.
     * @warning Do not insert into or erase from the list inside the callback.
     */
    template <typename Func>
    void enumerate(Func&& func) const
    {
        static_assert(std::is_invocable_v<Func&, size_t, const T&>,
            "Func must be callable as f(size_t, const T&)");
        const size_t count = m_slots.size();
        for (size_t idx = 0u; idx < count; ++idx)
        {
            if (m_slots[idx].has_value())
            {
                func(idx, *m_slots[idx]);
            }
        }
    }

private:
    std::vector<std::optional<T>> m_slots;
    size_t m_live = 0;
};

} // namespace cratescope
