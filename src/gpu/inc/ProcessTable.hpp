#ifndef MODELBENCH_GPU_PROCESS_TABLE_HPP
#define MODELBENCH_GPU_PROCESS_TABLE_HPP
/**
 * @file ProcessTable.hpp
 * @brief Parser for the runtime's column-aligned process table (`ps` output).
 * @note Pure functions: no I/O, thread-safe.
 *
 * Example input:
 * @code
 *   NAME          ID              SIZE     PROCESSOR          CONTEXT    UNTIL
 *   mistral:7b    6577803aa9a0    5.1 GB   100% GPU           4096       24 hours from now
 *   qwen3:14b     bdbd181c33f2    10 GB    48%/52% CPU/GPU    8192       4 minutes from now
 * @endcode
 *
 * Columns are aligned with spaces but values contain spaces too ("5.1 GB",
 * "100% GPU"), so splitting on whitespace misplaces fields. The header
 * offsets of PROCESSOR and CONTEXT delimit the processor value instead.
 */

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace modelbench {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::string_view PROCESSOR_COLUMN = "PROCESSOR";
inline constexpr std::string_view CONTEXT_COLUMN = "CONTEXT";

/// Token index of the processor value in the whitespace fallback.
inline constexpr std::size_t FALLBACK_PROCESSOR_TOKEN = 3;

/* ----------------------------- TableStrategy ----------------------------- */

/**
 * @brief How rows of a process table are split into fields.
 */
enum class TableStrategy : std::uint8_t {
  HeaderColumns = 0,  ///< Slice rows at header column offsets (preserves "100% GPU")
  WhitespaceFallback, ///< Unknown header: take whitespace token FALLBACK_PROCESSOR_TOKEN
};

/**
 * @brief Convert strategy to string.
 * @note RT-safe: Returns static string.
 */
[[nodiscard]] const char* toString(TableStrategy strategy) noexcept;

/* ----------------------------- TableLayout ----------------------------- */

/**
 * @brief Column geometry chosen from the header line.
 */
struct TableLayout {
  TableStrategy strategy{TableStrategy::WhitespaceFallback};
  std::size_t processorStart{0};                     ///< Offset of PROCESSOR in the header
  std::size_t processorEnd{std::string_view::npos}; ///< Offset of CONTEXT, or npos for EOL
};

/**
 * @brief Select the parse strategy for a header line.
 * @param header First line of the table.
 * @return HeaderColumns if PROCESSOR is present, WhitespaceFallback otherwise.
 *
 * CONTEXT bounds the processor slice only when it appears after PROCESSOR.
 */
[[nodiscard]] TableLayout detectTableLayout(std::string_view header) noexcept;

/**
 * @brief Extract the processor value of one data row.
 * @param row Data line.
 * @param layout Layout from detectTableLayout().
 * @return Trimmed value, or nullopt when the row cannot supply one.
 */
[[nodiscard]] std::optional<std::string> extractProcessor(std::string_view row,
                                                          const TableLayout& layout);

/* ----------------------------- ProcessTable ----------------------------- */

/**
 * @brief One loaded model as listed in the process table.
 */
struct ProcessRow {
  std::string name;      ///< First token of the row (model identifier)
  std::string processor; ///< Full processor value, e.g. "100% GPU"
};

/**
 * @brief Parsed process table.
 */
struct ProcessTable {
  TableLayout layout{};
  std::vector<ProcessRow> rows{};
  std::size_t skippedRows{0}; ///< Non-blank rows that yielded no processor value

  /// @brief True if any row's processor value mentions GPU (case-insensitive).
  [[nodiscard]] bool anyGpu() const noexcept;

  /// @brief Processor value of the first GPU row, else of the first CPU row, else "".
  [[nodiscard]] std::string gpuLayers() const;
};

/**
 * @brief Parse the complete process-table text.
 * @param text Raw stdout of `ps`.
 * @return Parsed rows; malformed rows are counted, never fatal.
 */
[[nodiscard]] ProcessTable parseProcessTable(std::string_view text);

/// @brief True if a processor value indicates GPU execution ("100% GPU", "48%/52% CPU/GPU").
[[nodiscard]] bool indicatesGpu(std::string_view processor) noexcept;

/// @brief True if a processor value indicates CPU execution.
[[nodiscard]] bool indicatesCpu(std::string_view processor) noexcept;

} // namespace gpu

} // namespace modelbench

#endif // MODELBENCH_GPU_PROCESS_TABLE_HPP
