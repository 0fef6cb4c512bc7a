#include <cochange/commit_stream.h>

#include <cochange/record_parser.h>

#include <cstring>
#include <utility>

namespace cochange {
namespace {

std::string_view StripLeadingNewlines(std::string_view token) {
  while (!token.empty() && (token.front() == '\n' || token.front() == '\r')) {
    token.remove_prefix(1);
  }
  return token;
}

bool ParseCount(std::string_view text, std::int64_t &value) {
  if (text.empty()) {
    return false;
  }
  value = 0;
  for (const auto character : text) {
    if (character < '0' || character > '9') {
      return false;
    }
    value = value * 10 + (character - '0');
  }
  return true;
}

std::size_t HeaderTokens(RecordLayout layout) {
  return layout == RecordLayout::kNameStatus ? 7 : 1;
}

// Path tokens following a name-status entry. A token that is not a status
// keeps the stream at an entry start, as the parser does.
std::size_t PathsAfterStatus(std::string_view token) {
  const std::string status(StripLeadingNewlines(token));
  if (status.empty() || !IsStatusToken(status)) {
    return 0;
  }
  return status.size() > 1 ? 2 : 1;
}

// A numstat entry with an empty path is a rename or copy: old and new path
// follow as their own tokens.
std::size_t PathsAfterCounts(std::string_view token) {
  const auto counts = StripLeadingNewlines(token);
  const auto first_tab = counts.find('\t');
  if (first_tab == std::string_view::npos) {
    return 0;
  }
  const auto second_tab = counts.find('\t', first_tab + 1);
  if (second_tab == std::string_view::npos) {
    return 0;
  }
  return second_tab + 1 == counts.size() ? 2 : 0;
}

} // namespace

CommitStream::CommitStream(std::unique_ptr<ByteSource> source,
                           std::string marker, RecordLayout layout)
    : source_(std::move(source)), marker_(std::move(marker)), layout_(layout),
      buffer_(kChunkSize) {}

bool CommitStream::IsMarker(const std::string &token) const {
  return StripLeadingNewlines(token) == marker_;
}

void CommitStream::Consume(const std::string &token) {
  if (header_left_ > 0) {
    --header_left_;
    return;
  }
  if (paths_left_ > 0) {
    --paths_left_;
    return;
  }
  paths_left_ = layout_ == RecordLayout::kNameStatus ? PathsAfterStatus(token)
                                                     : PathsAfterCounts(token);
}

bool CommitStream::NextToken(std::string &token) {
  token.clear();
  while (true) {
    if (buffer_pos_ < buffer_end_) {
      const auto *begin = buffer_.data() + buffer_pos_;
      const auto *terminator = static_cast<const char *>(
          std::memchr(begin, '\0', buffer_end_ - buffer_pos_));
      if (terminator != nullptr) {
        token.append(begin, terminator);
        buffer_pos_ += static_cast<std::size_t>(terminator - begin) + 1;
        ++cursor_;
        return true;
      }
      token.append(begin, buffer_end_ - buffer_pos_);
      buffer_pos_ = buffer_end_;
    }
    if (eof_) {
      break;
    }
    buffer_pos_ = 0;
    buffer_end_ = source_->Read(buffer_.data(), buffer_.size());
    if (buffer_end_ == 0) {
      eof_ = true;
    }
  }
  // An unterminated tail is a token unless it is only the newline git ends
  // its output with.
  if (StripLeadingNewlines(token).empty()) {
    token.clear();
    return false;
  }
  ++cursor_;
  return true;
}

bool CommitStream::Next(RawRecord &record) {
  if (done_) {
    return false;
  }
  std::string token;
  while (NextToken(token)) {
    const auto position = cursor_ - 1;
    if (AtEntryStart() && IsMarker(token)) {
      header_left_ = HeaderTokens(layout_);
      const bool has_content = current_.has_marker || !current_.tokens.empty();
      RawRecord next;
      next.has_marker = true;
      next.first_cursor = position + 1;
      if (has_content) {
        record = std::move(current_);
        current_ = std::move(next);
        return true;
      }
      current_ = std::move(next);
      continue;
    }
    if (current_.tokens.empty() && !current_.has_marker) {
      current_.first_cursor = position;
    }
    Consume(token);
    current_.tokens.push_back(std::move(token));
    token = std::string();
  }
  done_ = true;
  if (current_.has_marker || !current_.tokens.empty()) {
    record = std::move(current_);
    current_ = RawRecord{};
    return true;
  }
  return false;
}

void CommitStream::Finish() { source_->Finish(); }

NumstatRecord ParseNumstatRecord(const RawRecord &record) {
  NumstatRecord parsed;
  if (!record.has_marker || record.tokens.empty()) {
    return parsed;
  }
  parsed.oid = std::string(StripLeadingNewlines(record.tokens.front()));
  for (std::size_t i = 1; i < record.tokens.size(); ++i) {
    const auto token = StripLeadingNewlines(record.tokens[i]);
    if (token.empty()) {
      continue;
    }
    const auto first_tab = token.find('\t');
    if (first_tab == std::string_view::npos) {
      continue;
    }
    const auto second_tab = token.find('\t', first_tab + 1);
    if (second_tab == std::string_view::npos) {
      continue;
    }
    NumstatEntry entry;
    const auto added = token.substr(0, first_tab);
    const auto deleted = token.substr(first_tab + 1, second_tab - first_tab - 1);
    if (added == "-" && deleted == "-") {
      entry.binary = true;
    } else if (!ParseCount(added, entry.lines_added) ||
               !ParseCount(deleted, entry.lines_deleted)) {
      continue;
    }
    // Paths follow the original token, not the newline-stripped view.
    const auto &raw = record.tokens[i];
    const auto path_offset = raw.size() - token.size() + second_tab + 1;
    entry.path = raw.substr(path_offset);
    if (entry.path.empty()) {
      // Renamed or copied: old path and new path follow as their own tokens.
      if (i + 2 >= record.tokens.size()) {
        break;
      }
      entry.path = record.tokens[i + 2];
      i += 2;
    }
    parsed.entries.push_back(std::move(entry));
  }
  return parsed;
}

NumstatReader::NumstatReader(std::unique_ptr<RecordSource> source)
    : source_(std::move(source)) {}

bool NumstatReader::Fill() {
  if (has_lookahead_) {
    return true;
  }
  if (exhausted_) {
    return false;
  }
  RawRecord record;
  while (source_->Next(record)) {
    if (!record.has_marker) {
      continue;
    }
    lookahead_ = ParseNumstatRecord(record);
    has_lookahead_ = true;
    return true;
  }
  exhausted_ = true;
  return false;
}

const NumstatRecord *NumstatReader::Advance(const std::string &oid) {
  while (Fill()) {
    if (lookahead_.oid == oid) {
      has_lookahead_ = false;
      return &lookahead_;
    }
    has_lookahead_ = false;
  }
  return nullptr;
}

void NumstatReader::Finish() {
  RawRecord record;
  while (source_->Next(record)) {
  }
  source_->Finish();
}

} // namespace cochange
