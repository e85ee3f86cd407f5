/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "cratescope/common/common.hpp"
#include "cratescope/common/graph_enums.hpp"

namespace cratescope
{

/**
 * @brief Error codes for crate graph construction, mutation and configuration.
 */
enum class CrateGraphErrorCode
{
    MalformedInput,
    EmptyInput,
    MalformedSizeReport,
    AmbiguousSelector,
    InvalidNodeIndex,
    SelfLoop,
    CycleDetected,
    InvalidOption,
    InvalidState
};

/**
 * @brief Exception class for crate graph errors.
 *
 * @details
 * `CrateGraphError` is thrown when input text cannot be parsed, when an index does not
 * refer to a live node, or when an operation would break a graph invariant. Each
 * exception carries an error code and a descriptive message.
 *
 * @par Usage errors
 * `EmptyInput`, `AmbiguousSelector` and `InvalidOption` describe a problem with what
 * the caller asked for rather than with the data; see `is_usage_error()`.
 */
class CrateGraphError : public std::exception
{
public:
    /**
     * @brief Construct a CrateGraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    CrateGraphError(CrateGraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    CrateGraphErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief True for errors caused by the caller's request rather than the data.
     */
    bool is_usage_error() const noexcept
    {
        return m_code == CrateGraphErrorCode::EmptyInput ||
               m_code == CrateGraphErrorCode::AmbiguousSelector ||
               m_code == CrateGraphErrorCode::InvalidOption;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    CrateGraphErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Thrown by `TreeParser` when a line of the tree listing cannot be interpreted.
 *
 * @details
 * Parsing is aborted at the first bad line. The 1-based line number and the raw line
 * text are kept so the caller can point the user at the offending input.
 */
class TreeParseError : public CrateGraphError
{
public:
    TreeParseError(size_t line_number, std::string line, const std::string& reason)
        : CrateGraphError(CrateGraphErrorCode::MalformedInput,
                          "Malformed tree listing at line " + std::to_string(line_number) +
                              ": " + reason + ": '" + line + "'")
        , m_line_number(line_number)
        , m_line(std::move(line))
    {
    }

    size_t line_number() const noexcept
    {
        return m_line_number;
    }

    const std::string& line() const noexcept
    {
        return m_line;
    }

private:
    size_t m_line_number;
    std::string m_line;
};

/**
 * @brief Thrown when a root or exclude pattern does not resolve to exactly one node.
 *
 * @details
 * The full list of matching node indices is kept (empty when nothing matched); the
 * selection is never resolved automatically.
 */
class AmbiguousSelectorError : public CrateGraphError
{
public:
    AmbiguousSelectorError(std::string pattern, std::vector<NodeIdx> matches, const std::string& message)
        : CrateGraphError(CrateGraphErrorCode::AmbiguousSelector, message)
        , m_pattern(std::move(pattern))
        , m_matches(std::move(matches))
    {
    }

    const std::string& pattern() const noexcept
    {
        return m_pattern;
    }

    const std::vector<NodeIdx>& matches() const noexcept
    {
        return m_matches;
    }

private:
    std::string m_pattern;
    std::vector<NodeIdx> m_matches;
};

} // namespace cratescope
