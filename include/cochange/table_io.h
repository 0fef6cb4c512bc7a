#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cochange {

std::string EscapeField(const std::string &value);
std::string UnescapeField(const std::string &value);
std::vector<std::string> SplitRow(const std::string &line);
std::string JoinRow(const std::vector<std::string> &fields);
std::string FormatDouble(double value);

class Fnv1a {
public:
  void Update(std::string_view bytes);
  std::uint64_t Value() const { return state_; }
  std::string Hex() const;

private:
  std::uint64_t state_ = 14695981039346656037ull;
};

// Streams one tab-separated table. Rows are escaped, so a field may carry
// any byte; the first line names the columns.
class TableWriter {
public:
  TableWriter(std::filesystem::path path, std::vector<std::string> columns);

  void Append(const std::vector<std::string> &row);
  void Close();

  const std::filesystem::path &Path() const { return path_; }
  std::size_t RowCount() const { return rows_; }
  std::string Checksum() const { return checksum_.Hex(); }

private:
  void WriteLine(const std::string &line);

  std::filesystem::path path_;
  std::size_t column_count_;
  std::ofstream stream_;
  std::size_t rows_ = 0;
  Fnv1a checksum_;
};

class TableReader {
public:
  explicit TableReader(const std::filesystem::path &path);

  const std::vector<std::string> &Columns() const { return columns_; }
  std::size_t Column(const std::string &name) const;
  bool Next(std::vector<std::string> &row);

private:
  std::filesystem::path path_;
  std::ifstream stream_;
  std::vector<std::string> columns_;
  std::unordered_map<std::string, std::size_t> column_index_;
};

} // namespace cochange
