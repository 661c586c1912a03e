// refiner/basic/source_manager.cpp - Line table and slicing
#include "refiner/basic/source_manager.hpp"

#include <algorithm>

namespace refiner
{

LineColumn SourceManager::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }
  if (offset > source_.size()) {
    offset = static_cast<uint32_t>(source_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  --it;  // line_offsets_[0] == 0, so upper_bound never returns begin()

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  return {line, offset - *it + 1};
}

std::string_view SourceManager::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(source_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1] - 1;
  }
  if (end > start && source_[end - 1] == '\r') {
    --end;
  }
  return std::string_view(source_).substr(start, end - start);
}

std::string_view SourceManager::get_slice(SourceRange range) const noexcept
{
  if (range.is_invalid()) {
    return {};
  }
  const uint32_t start = range.get_begin().get_offset();
  uint32_t end = range.get_end().get_offset();
  if (start >= source_.size() || end < start) {
    return {};
  }
  end = std::min(end, static_cast<uint32_t>(source_.size()));
  return std::string_view(source_).substr(start, end - start);
}

FullSourceRange SourceManager::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (range.is_invalid()) {
    return result;
  }

  result.start_byte = range.get_begin().get_offset();
  result.end_byte = range.get_end().get_offset();

  const LineColumn start_lc = get_line_column(result.start_byte);
  const LineColumn end_lc = get_line_column(result.end_byte);
  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;
  return result;
}

void SourceManager::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);
  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace refiner
