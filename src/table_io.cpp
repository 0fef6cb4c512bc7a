#include <cochange/table_io.h>

#include <cochange/errors.h>

#include <cstdio>
#include <utility>

namespace cochange {

std::string EscapeField(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '\\':
      escaped.append("\\\\");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string UnescapeField(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '\\' && i + 1 < value.size()) {
      const auto next = value[++i];
      if (next == 't') {
        unescaped.push_back('\t');
      } else if (next == 'n') {
        unescaped.push_back('\n');
      } else if (next == 'r') {
        unescaped.push_back('\r');
      } else {
        unescaped.push_back(next);
      }
      continue;
    }
    unescaped.push_back(value[i]);
  }
  return unescaped;
}

std::vector<std::string> SplitRow(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  for (const auto character : line) {
    if (character == '\t') {
      fields.push_back(UnescapeField(current));
      current.clear();
      continue;
    }
    current.push_back(character);
  }
  fields.push_back(UnescapeField(current));
  return fields;
}

std::string JoinRow(const std::vector<std::string> &fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(EscapeField(fields[i]));
  }
  return line;
}

std::string FormatDouble(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.12g", value);
  return buffer;
}

void Fnv1a::Update(std::string_view bytes) {
  for (const auto character : bytes) {
    state_ ^= static_cast<unsigned char>(character);
    state_ *= 1099511628211ull;
  }
}

std::string Fnv1a::Hex() const {
  char buffer[17];
  std::snprintf(buffer, sizeof(buffer), "%016llx",
                static_cast<unsigned long long>(state_));
  return buffer;
}

TableWriter::TableWriter(std::filesystem::path path,
                         std::vector<std::string> columns)
    : path_(std::move(path)), column_count_(columns.size()),
      stream_(path_, std::ios::binary | std::ios::trunc) {
  if (!stream_) {
    throw ArtifactWriteFailure("Unable to open table for writing: " +
                               path_.string());
  }
  WriteLine(JoinRow(columns));
}

void TableWriter::Append(const std::vector<std::string> &row) {
  if (row.size() != column_count_) {
    throw ArtifactWriteFailure("Row width " + std::to_string(row.size()) +
                               " does not match " +
                               std::to_string(column_count_) +
                               " columns in " + path_.string());
  }
  WriteLine(JoinRow(row));
  ++rows_;
}

void TableWriter::Close() {
  if (!stream_.is_open()) {
    return;
  }
  stream_.flush();
  const bool healthy = static_cast<bool>(stream_);
  stream_.close();
  if (!healthy) {
    throw ArtifactWriteFailure("Failed to flush table: " + path_.string());
  }
}

void TableWriter::WriteLine(const std::string &line) {
  if (!stream_.is_open()) {
    throw ArtifactWriteFailure("Table already closed: " + path_.string());
  }
  stream_ << line << '\n';
  if (!stream_) {
    throw ArtifactWriteFailure("Failed to write table: " + path_.string());
  }
  checksum_.Update(line);
  checksum_.Update("\n");
}

TableReader::TableReader(const std::filesystem::path &path)
    : path_(path), stream_(path, std::ios::binary) {
  if (!stream_) {
    throw IncompleteDataset("Missing table: " + path.string());
  }
  std::string header;
  if (!std::getline(stream_, header)) {
    throw IncompleteDataset("Table has no header: " + path.string());
  }
  columns_ = SplitRow(header);
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    column_index_.emplace(columns_[i], i);
  }
}

std::size_t TableReader::Column(const std::string &name) const {
  const auto it = column_index_.find(name);
  if (it == column_index_.end()) {
    throw IncompleteDataset("Table " + path_.string() + " has no column " +
                            name);
  }
  return it->second;
}

bool TableReader::Next(std::vector<std::string> &row) {
  std::string line;
  if (!std::getline(stream_, line)) {
    return false;
  }
  row = SplitRow(line);
  if (row.size() != columns_.size()) {
    throw IncompleteDataset("Corrupt row in " + path_.string());
  }
  return true;
}

} // namespace cochange
