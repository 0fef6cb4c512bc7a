#ifndef COCHANGE_TEST_SUPPORT_FAKE_REPOSITORY_H
#define COCHANGE_TEST_SUPPORT_FAKE_REPOSITORY_H

#include <cochange/errors.h>
#include <cochange/git_repository.h>
#include <cochange/interfaces.h>
#include <cochange/process_byte_source.h>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace cochange {
namespace test {

inline std::string Oid(int number) {
  char buffer[41];
  std::snprintf(buffer, sizeof(buffer), "%040x", number);
  return buffer;
}

inline std::string Token(const std::string &text) {
  return text + std::string(1, '\0');
}

// Builds the two NUL-separated exports `git log -z` produces for a scripted
// history, oldest commit first: an empty token between commits and a newline
// ahead of the first change of each commit.
class HistoryScript {
public:
  HistoryScript &Commit(const std::string &oid, const std::string &email,
                        std::int64_t timestamp,
                        const std::string &subject = "change",
                        const std::string &parents = "") {
    if (!history_.empty()) {
      history_.push_back('\0');
      numstat_.push_back('\0');
    }
    const auto author = email.substr(0, email.find('@'));
    history_ += Token(std::string(kCommitMarker)) + Token(oid) +
                Token(parents) + Token(author) + Token(email) +
                Token(std::to_string(timestamp)) +
                Token(std::to_string(timestamp)) + Token(subject);
    numstat_ += Token(std::string(kNumstatMarker)) + Token(oid);
    first_change_ = true;
    first_numstat_ = true;
    return *this;
  }

  HistoryScript &Add(const std::string &path, std::int64_t lines = 10) {
    return Change("A", path, lines, 0);
  }

  HistoryScript &Modify(const std::string &path, std::int64_t added = 1,
                        std::int64_t deleted = 0) {
    return Change("M", path, added, deleted);
  }

  HistoryScript &Delete(const std::string &path, std::int64_t lines = 10) {
    return Change("D", path, 0, lines);
  }

  HistoryScript &Rename(const std::string &old_path,
                        const std::string &new_path, int similarity = 100) {
    history_ += Status("R" + std::to_string(similarity)) + Token(old_path) +
                Token(new_path);
    numstat_ += NumstatToken("0\t0\t") + Token(old_path) + Token(new_path);
    return *this;
  }

  HistoryScript &Binary(const std::string &path) {
    history_ += Status("M") + Token(path);
    numstat_ += NumstatToken("-\t-\t" + path);
    return *this;
  }

  // Appends tokens verbatim to the history export only.
  HistoryScript &Raw(const std::vector<std::string> &tokens) {
    for (const auto &token : tokens) {
      history_ += Token(token);
    }
    return *this;
  }

  const std::string &History() const { return history_; }
  const std::string &Numstat() const { return numstat_; }

private:
  std::string Status(const std::string &status) {
    const auto token = (first_change_ ? "\n" : "") + status;
    first_change_ = false;
    return Token(token);
  }

  std::string NumstatToken(const std::string &entry) {
    const auto token = (first_numstat_ ? "\n" : "") + entry;
    first_numstat_ = false;
    return Token(token);
  }

  HistoryScript &Change(const std::string &status, const std::string &path,
                        std::int64_t added, std::int64_t deleted) {
    history_ += Status(status) + Token(path);
    numstat_ += NumstatToken(std::to_string(added) + "\t" +
                             std::to_string(deleted) + "\t" + path);
    return *this;
  }

  std::string history_;
  std::string numstat_;
  bool first_change_ = true;
  bool first_numstat_ = true;
};

// Serves a scripted history in small chunks so records straddle reads.
class FakeGateway : public RepositoryGateway {
public:
  explicit FakeGateway(const HistoryScript &script)
      : history_(script.History()), numstat_(script.Numstat()) {}

  void Verify(const MiningConfig &config) override {
    if (unavailable_) {
      throw RepositoryUnavailable("Not a git repository: " +
                                  config.repository.string());
    }
  }

  std::unique_ptr<ByteSource> OpenHistory(const MiningConfig &) override {
    ++history_opened_;
    auto source = std::make_unique<StringByteSource>(history_, 7);
    if (history_failure_) {
      source->FailOnFinish(*history_failure_);
    }
    return source;
  }

  std::unique_ptr<ByteSource> OpenNumstat(const MiningConfig &) override {
    ++numstat_opened_;
    return std::make_unique<StringByteSource>(numstat_, 5);
  }

  HeadSizes HeadFileSizes(const MiningConfig &) override { return head_sizes_; }

  void SetUnavailable() { unavailable_ = true; }
  void FailHistory(std::string message) {
    history_failure_ = std::move(message);
  }
  void SetHeadSize(const std::string &path, std::uint64_t size) {
    head_sizes_[path] = size;
  }

  int HistoryOpened() const { return history_opened_; }
  int NumstatOpened() const { return numstat_opened_; }

private:
  std::string history_;
  std::string numstat_;
  HeadSizes head_sizes_;
  bool unavailable_ = false;
  std::optional<std::string> history_failure_;
  int history_opened_ = 0;
  int numstat_opened_ = 0;
};

} // namespace test
} // namespace cochange

#endif // COCHANGE_TEST_SUPPORT_FAKE_REPOSITORY_H
