#pragma once

#include <cochange/interfaces.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cochange {

// Token layout behind each marker: a name-status export carries seven header
// fields then status/path entries, a numstat export carries the object id
// then count entries.
enum class RecordLayout { kNameStatus, kNumstat };

// Splits a NUL-separated export into one record per commit marker. A token
// equal to the marker only opens a record where an entry may start, so header
// fields and paths spelled like the marker stay inside their record. Holds a
// single record at a time; the stream cannot be rewound.
class CommitStream : public RecordSource {
public:
  static constexpr std::size_t kChunkSize = 64 * 1024;

  CommitStream(std::unique_ptr<ByteSource> source, std::string marker,
               RecordLayout layout = RecordLayout::kNameStatus);

  bool Next(RawRecord &record) override;
  void Finish() override;

  std::size_t TokensRead() const { return cursor_; }

private:
  bool NextToken(std::string &token);
  bool IsMarker(const std::string &token) const;
  bool AtEntryStart() const { return header_left_ == 0 && paths_left_ == 0; }
  void Consume(const std::string &token);

  std::unique_ptr<ByteSource> source_;
  std::string marker_;
  RecordLayout layout_;
  std::size_t header_left_ = 0;
  std::size_t paths_left_ = 0;
  std::vector<char> buffer_;
  std::size_t buffer_pos_ = 0;
  std::size_t buffer_end_ = 0;
  bool eof_ = false;
  bool done_ = false;
  std::size_t cursor_ = 0;
  RawRecord current_;
};

struct NumstatEntry {
  std::string path;
  std::int64_t lines_added = 0;
  std::int64_t lines_deleted = 0;
  bool binary = false;
};

struct NumstatRecord {
  std::string oid;
  std::vector<NumstatEntry> entries;
};

NumstatRecord ParseNumstatRecord(const RawRecord &record);

// Follows the history stream commit by commit. Lookups must come in stream
// order; records the history side rejected are skipped over.
class NumstatReader {
public:
  explicit NumstatReader(std::unique_ptr<RecordSource> source);

  const NumstatRecord *Advance(const std::string &oid);
  void Finish();

private:
  bool Fill();

  std::unique_ptr<RecordSource> source_;
  NumstatRecord lookahead_;
  bool has_lookahead_ = false;
  bool exhausted_ = false;
};

} // namespace cochange
