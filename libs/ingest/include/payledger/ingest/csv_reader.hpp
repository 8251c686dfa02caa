#pragma once

#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace payledger {
namespace ingest {

struct CsvOptions {
  char delimiter{','};
  bool trim{true};
};

struct CsvRow {
  std::uint64_t line{0};  // 1-based line the row starts on
  std::vector<std::string> fields{};
};

// Streaming reader for delimited text. Quoted fields may span lines and
// contain the delimiter. Blank lines are skipped.
class CsvReader {
 public:
  explicit CsvReader(std::istream& input, CsvOptions options = {});
  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;

  // Returns false at end of input; throws std::runtime_error on an
  // unterminated quoted field.
  bool next(CsvRow& out_row);

 private:
  std::istream& input_;
  CsvOptions options_;
  std::uint64_t line_{0};

  bool read_line(std::string& out_line);
};

}  // namespace ingest
}  // namespace payledger
