// srcsym/basic/source_manager.cpp - Line table and slicing
#include "srcsym/basic/source_manager.hpp"

#include <algorithm>
#include <cctype>

namespace srcsym
{

namespace
{

bool is_word_char(char c)
{
  return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_' || c == '$';
}

}  // namespace

SourceFile::SourceFile(std::string name, std::string content)
: name_(std::move(name)), content_(std::move(content))
{
  build_line_table();
}

LineColumn SourceFile::get_line_column(uint32_t offset) const noexcept
{
  if (line_offsets_.empty()) {
    return {};
  }

  if (offset > content_.size()) {
    offset = static_cast<uint32_t>(content_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), offset);
  if (it == line_offsets_.begin()) {
    return {1, offset + 1};
  }
  --it;

  const uint32_t line = static_cast<uint32_t>(it - line_offsets_.begin()) + 1;
  const uint32_t column = offset - *it + 1;
  return {line, column};
}

std::string_view SourceFile::get_line(uint32_t line_index) const noexcept
{
  if (line_index >= line_offsets_.size()) {
    return {};
  }

  const uint32_t start = line_offsets_[line_index];
  auto end = static_cast<uint32_t>(content_.size());
  if (line_index + 1 < line_offsets_.size()) {
    end = line_offsets_[line_index + 1];
    if (end > start && content_[end - 1] == '\n') {
      --end;
    }
  }
  if (end > start && content_[end - 1] == '\r') {
    --end;
  }

  return std::string_view(content_).substr(start, end - start);
}

SourceRange SourceFile::line_range(uint32_t line) const noexcept
{
  if (line == 0 || line > line_offsets_.size()) {
    return {};
  }
  const uint32_t start = line_offsets_[line - 1];
  const auto text = get_line(line - 1);
  return {start, start + static_cast<uint32_t>(text.size())};
}

SourceRange SourceFile::find_on_line(uint32_t line, std::string_view word) const noexcept
{
  const SourceRange whole = line_range(line);
  if (whole.is_invalid() || word.empty()) {
    return whole;
  }

  const std::string_view text = get_line(line - 1);
  size_t pos = text.find(word);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !is_word_char(text[pos - 1]);
    const size_t after = pos + word.size();
    const bool right_ok = after >= text.size() || !is_word_char(text[after]);
    if (left_ok && right_ok) {
      const uint32_t begin = whole.get_begin().get_offset() + static_cast<uint32_t>(pos);
      return {begin, begin + static_cast<uint32_t>(word.size())};
    }
    pos = text.find(word, pos + 1);
  }
  return whole;
}

std::string_view SourceFile::get_slice(SourceRange range) const noexcept
{
  if (!range.is_valid()) {
    return {};
  }

  const auto start = range.get_begin().get_offset();
  auto end = range.get_end().get_offset();
  if (start >= content_.size()) {
    return {};
  }
  if (end > content_.size()) {
    end = static_cast<uint32_t>(content_.size());
  }
  return std::string_view(content_).substr(start, end - start);
}

FullSourceRange SourceFile::get_full_range(SourceRange range) const noexcept
{
  FullSourceRange result;
  if (!range.is_valid()) {
    return result;
  }

  result.start_byte = range.get_begin().get_offset();
  result.end_byte = range.get_end().get_offset();

  const auto start_lc = get_line_column(result.start_byte);
  const auto end_lc = get_line_column(result.end_byte);

  result.start_line = start_lc.line;
  result.start_column = start_lc.column;
  result.end_line = end_lc.line;
  result.end_column = end_lc.column;

  return result;
}

void SourceFile::build_line_table()
{
  line_offsets_.clear();
  line_offsets_.push_back(0);

  for (size_t i = 0; i < content_.size(); ++i) {
    if (content_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

}  // namespace srcsym
