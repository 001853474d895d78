/**
 * @file ProcessTable.cpp
 * @brief Header-offset and whitespace-fallback parsing of the runtime process table.
 */

#include "src/gpu/inc/ProcessTable.hpp"
#include "src/helpers/inc/Strings.hpp"

namespace modelbench {

namespace gpu {

namespace {

using modelbench::helpers::strings::containsIgnoreCase;
using modelbench::helpers::strings::splitLines;
using modelbench::helpers::strings::splitWhitespace;
using modelbench::helpers::strings::trim;

/// Slice [start, end) of row, clamped to the row length.
std::string_view sliceColumn(std::string_view row, std::size_t start, std::size_t end) noexcept {
  if (start >= row.size()) {
    return {};
  }
  const std::size_t LEN = (end == std::string_view::npos || end > row.size()) ? row.size() - start
                                                                              : end - start;
  return row.substr(start, LEN);
}

} // namespace

/* ----------------------------- TableStrategy ----------------------------- */

const char* toString(TableStrategy strategy) noexcept {
  switch (strategy) {
  case TableStrategy::HeaderColumns:
    return "header-columns";
  case TableStrategy::WhitespaceFallback:
    return "whitespace-fallback";
  default:
    return "unknown";
  }
}

/* ----------------------------- Layout ----------------------------- */

TableLayout detectTableLayout(std::string_view header) noexcept {
  TableLayout layout{};

  const std::size_t PROCESSOR = header.find(PROCESSOR_COLUMN);
  if (PROCESSOR == std::string_view::npos) {
    return layout;
  }

  layout.strategy = TableStrategy::HeaderColumns;
  layout.processorStart = PROCESSOR;

  const std::size_t CONTEXT = header.find(CONTEXT_COLUMN, PROCESSOR + PROCESSOR_COLUMN.size());
  layout.processorEnd = CONTEXT;
  return layout;
}

std::optional<std::string> extractProcessor(std::string_view row, const TableLayout& layout) {
  if (layout.strategy == TableStrategy::HeaderColumns) {
    const std::string_view VALUE =
        trim(sliceColumn(row, layout.processorStart, layout.processorEnd));
    if (VALUE.empty()) {
      return std::nullopt;
    }
    return std::string(VALUE);
  }

  const std::vector<std::string_view> TOKENS = splitWhitespace(row);
  if (TOKENS.size() <= FALLBACK_PROCESSOR_TOKEN) {
    return std::nullopt;
  }
  return std::string(TOKENS[FALLBACK_PROCESSOR_TOKEN]);
}

/* ----------------------------- Classification ----------------------------- */

bool indicatesGpu(std::string_view processor) noexcept { return containsIgnoreCase(processor, "GPU"); }

bool indicatesCpu(std::string_view processor) noexcept { return containsIgnoreCase(processor, "CPU"); }

/* ----------------------------- ProcessTable ----------------------------- */

bool ProcessTable::anyGpu() const noexcept {
  for (const ProcessRow& ROW : rows) {
    if (indicatesGpu(ROW.processor)) {
      return true;
    }
  }
  return false;
}

std::string ProcessTable::gpuLayers() const {
  const ProcessRow* cpuRow = nullptr;
  for (const ProcessRow& ROW : rows) {
    if (indicatesGpu(ROW.processor)) {
      return ROW.processor;
    }
    if (cpuRow == nullptr && indicatesCpu(ROW.processor)) {
      cpuRow = &ROW;
    }
  }
  return cpuRow != nullptr ? cpuRow->processor : std::string{};
}

/* ----------------------------- API ----------------------------- */

ProcessTable parseProcessTable(std::string_view text) {
  ProcessTable table{};

  const std::vector<std::string_view> LINES = splitLines(text);

  // Leading blank lines are not a header.
  std::size_t headerIdx = 0;
  while (headerIdx < LINES.size() && trim(LINES[headerIdx]).empty()) {
    ++headerIdx;
  }
  if (headerIdx >= LINES.size()) {
    return table;
  }

  table.layout = detectTableLayout(LINES[headerIdx]);

  for (std::size_t i = headerIdx + 1; i < LINES.size(); ++i) {
    const std::string_view ROW = LINES[i];
    if (trim(ROW).empty()) {
      continue;
    }

    std::optional<std::string> processor = extractProcessor(ROW, table.layout);
    if (!processor) {
      ++table.skippedRows;
      continue;
    }

    const std::vector<std::string_view> TOKENS = splitWhitespace(ROW);
    table.rows.push_back(ProcessRow{std::string(TOKENS.front()), std::move(*processor)});
  }

  return table;
}

} // namespace gpu

} // namespace modelbench
