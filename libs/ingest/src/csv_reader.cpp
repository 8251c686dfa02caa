#include "payledger/ingest/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace payledger {
namespace ingest {

namespace {

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

bool is_space(char c) noexcept {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trimmed(const std::string& text) {
  const auto first = std::find_if_not(text.begin(), text.end(), is_space);
  const auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  if (first >= last) {
    return {};
  }
  return std::string(first, last);
}

bool is_blank(const std::string& line, bool trim) {
  if (!trim) {
    return line.empty();
  }
  return std::all_of(line.begin(), line.end(), is_space);
}

}  // namespace

CsvReader::CsvReader(std::istream& input, CsvOptions options)
    : input_(input), options_(options) {}

bool CsvReader::read_line(std::string& out_line) {
  if (!std::getline(input_, out_line)) {
    return false;
  }
  ++line_;
  if (line_ == 1 && out_line.starts_with(kUtf8Bom)) {
    out_line.erase(0, kUtf8Bom.size());
  }
  if (!out_line.empty() && out_line.back() == '\r') {
    out_line.pop_back();
  }
  return true;
}

bool CsvReader::next(CsvRow& out_row) {
  std::string line;
  do {
    if (!read_line(line)) {
      return false;
    }
  } while (is_blank(line, options_.trim));

  out_row.line = line_;
  out_row.fields.clear();

  std::string field;
  bool in_quotes = false;
  bool quoted = false;

  auto finish_field = [&]() {
    out_row.fields.push_back(options_.trim ? trimmed(field) : field);
    field.clear();
    quoted = false;
  };

  std::size_t pos = 0;
  while (true) {
    if (pos == line.size()) {
      if (!in_quotes) {
        finish_field();
        break;
      }
      if (!read_line(line)) {
        throw std::runtime_error("unterminated quoted field starting on line " +
                                 std::to_string(out_row.line));
      }
      field.push_back('\n');
      pos = 0;
      continue;
    }

    const char c = line[pos];
    if (in_quotes) {
      if (c == '"') {
        if (pos + 1 < line.size() && line[pos + 1] == '"') {
          field.push_back('"');
          pos += 2;
          continue;
        }
        in_quotes = false;
      } else {
        field.push_back(c);
      }
      ++pos;
      continue;
    }

    if (c == options_.delimiter) {
      finish_field();
    } else if (c == '"' && !quoted && (field.empty() || (options_.trim && is_blank(field, true)))) {
      field.clear();
      in_quotes = true;
      quoted = true;
    } else if (!(quoted && options_.trim && is_space(c))) {
      field.push_back(c);
    }
    ++pos;
  }

  return true;
}

}  // namespace ingest
}  // namespace payledger
