#pragma once

#include <cochange/logging.h>
#include <cochange/models.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cochange {

struct PathOwner {
  std::string path;
  FileId file_id = 0;
  bool current = false;
};

// Assigns stable file ids across renames. Updates must arrive in commit
// order: BeginCommit opens a commit and every update names it.
class FileIdentityResolver {
public:
  explicit FileIdentityResolver(std::shared_ptr<Logger> logger = nullptr);

  void BeginCommit(const std::string &commit_oid);

  FileId Resolve(const std::string &path, const std::string &commit_oid);
  FileId RecordRename(const std::string &old_path, const std::string &new_path,
                      const std::string &commit_oid);
  FileId RecordCopy(const std::string &source_path,
                    const std::string &new_path,
                    const std::string &commit_oid);
  FileId RecordDeletion(const std::string &path,
                        const std::string &commit_oid);
  FileId Apply(const ChangeEntry &entry);

  std::optional<FileId> FindByPath(const std::string &path) const;
  const FileIdentity &Identity(FileId file_id) const;
  const std::vector<FileIdentity> &Identities() const { return identities_; }
  std::vector<std::pair<std::string, FileId>> CurrentPaths() const;
  // Every path ever seen with its current or last owner, sorted by path.
  std::vector<PathOwner> PathIndex() const;
  bool VerifyNoOverlap() const;
  std::size_t InconsistencyCount() const { return inconsistencies_; }

private:
  FileIdentity &Mutable(FileId file_id);
  FileId Allocate();
  void Open(FileId file_id, const std::string &path,
            const std::string &commit_oid);
  void Close(FileId file_id, const std::string &commit_oid);
  void CheckCommit(const std::string &commit_oid) const;
  void ReportInconsistency(const std::string &message, const std::string &path,
                           const std::string &commit_oid);

  std::shared_ptr<Logger> logger_;
  std::vector<FileIdentity> identities_;
  std::unordered_map<std::string, FileId> current_;
  std::unordered_map<std::string, FileId> historical_;
  // Files whose open interval came from a rename and that no later commit
  // touched at that path.
  std::unordered_set<FileId> moved_by_rename_;
  std::unordered_set<std::string> begun_commits_;
  std::string current_commit_;
  std::size_t inconsistencies_ = 0;
};

} // namespace cochange
