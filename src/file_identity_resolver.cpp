#include <cochange/file_identity_resolver.h>

#include <algorithm>
#include <stdexcept>

namespace cochange {

FileIdentityResolver::FileIdentityResolver(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void FileIdentityResolver::BeginCommit(const std::string &commit_oid) {
  if (commit_oid.empty()) {
    throw std::logic_error("BeginCommit requires a commit id");
  }
  if (!begun_commits_.insert(commit_oid).second) {
    throw std::logic_error("Commit processed twice: " + commit_oid);
  }
  current_commit_ = commit_oid;
}

void FileIdentityResolver::CheckCommit(const std::string &commit_oid) const {
  if (commit_oid != current_commit_) {
    throw std::logic_error("Identity update for commit " + commit_oid +
                           " while processing " +
                           (current_commit_.empty() ? std::string("nothing")
                                                    : current_commit_));
  }
}

FileId FileIdentityResolver::Allocate() {
  FileIdentity identity;
  identity.file_id = static_cast<FileId>(identities_.size() + 1);
  identities_.push_back(std::move(identity));
  return identities_.back().file_id;
}

FileIdentity &FileIdentityResolver::Mutable(FileId file_id) {
  if (file_id == 0 || file_id > identities_.size()) {
    throw std::out_of_range("Unknown file id " + std::to_string(file_id));
  }
  return identities_[file_id - 1];
}

const FileIdentity &FileIdentityResolver::Identity(FileId file_id) const {
  if (file_id == 0 || file_id > identities_.size()) {
    throw std::out_of_range("Unknown file id " + std::to_string(file_id));
  }
  return identities_[file_id - 1];
}

void FileIdentityResolver::Open(FileId file_id, const std::string &path,
                                const std::string &commit_oid) {
  Mutable(file_id).lineage.push_back(LineageInterval{path, commit_oid, {}});
  current_[path] = file_id;
  historical_[path] = file_id;
}

void FileIdentityResolver::Close(FileId file_id,
                                 const std::string &commit_oid) {
  auto &identity = Mutable(file_id);
  for (auto &interval : identity.lineage) {
    if (interval.IsOpen()) {
      interval.valid_to_commit = commit_oid;
      const auto owner = current_.find(interval.path);
      if (owner != current_.end() && owner->second == file_id) {
        current_.erase(owner);
      }
    }
  }
}

void FileIdentityResolver::ReportInconsistency(const std::string &message,
                                               const std::string &path,
                                               const std::string &commit_oid) {
  ++inconsistencies_;
  logger_->Log(LogLevel::kWarn, "identity.inconsistency",
               {{"reason", message}, {"path", path}, {"commit", commit_oid}});
}

FileId FileIdentityResolver::Resolve(const std::string &path,
                                     const std::string &commit_oid) {
  CheckCommit(commit_oid);
  if (const auto owner = current_.find(path); owner != current_.end()) {
    moved_by_rename_.erase(owner->second);
    return owner->second;
  }
  if (const auto last = historical_.find(path); last != historical_.end()) {
    // Re-adding a path revives its last owner unless that file lives on
    // elsewhere.
    if (Identity(last->second).OpenInterval() == nullptr) {
      moved_by_rename_.erase(last->second);
      Open(last->second, path, commit_oid);
      return last->second;
    }
  }
  const auto file_id = Allocate();
  Open(file_id, path, commit_oid);
  return file_id;
}

FileId FileIdentityResolver::RecordRename(const std::string &old_path,
                                          const std::string &new_path,
                                          const std::string &commit_oid) {
  CheckCommit(commit_oid);
  std::optional<FileId> source;
  if (const auto owner = current_.find(old_path); owner != current_.end()) {
    source = owner->second;
  } else if (const auto last = historical_.find(old_path);
             last != historical_.end()) {
    // A second rename of the same old path moves the file again as long as
    // nothing touched it since the first one.
    const auto *open = Identity(last->second).OpenInterval();
    if (open != nullptr && open->path == new_path) {
      return last->second;
    }
    if (open == nullptr || moved_by_rename_.count(last->second) != 0) {
      source = last->second;
    }
  }
  if (!source) {
    const auto file_id = Allocate();
    Mutable(file_id).lineage.push_back(
        LineageInterval{old_path, commit_oid, commit_oid});
    if (historical_.find(old_path) == historical_.end()) {
      historical_[old_path] = file_id;
    }
    source = file_id;
  }

  if (const auto target = current_.find(new_path);
      target != current_.end() && target->second != *source) {
    const auto keeper = target->second;
    Close(*source, commit_oid);
    moved_by_rename_.erase(*source);
    ReportInconsistency("rename_target_owned", new_path, commit_oid);
    return keeper;
  }

  Close(*source, commit_oid);
  Open(*source, new_path, commit_oid);
  moved_by_rename_.insert(*source);
  return *source;
}

FileId FileIdentityResolver::RecordCopy(const std::string &source_path,
                                        const std::string &new_path,
                                        const std::string &commit_oid) {
  CheckCommit(commit_oid);
  if (const auto target = current_.find(new_path); target != current_.end()) {
    ReportInconsistency("copy_target_owned", new_path, commit_oid);
    return target->second;
  }
  logger_->Log(LogLevel::kDebug, "identity.copy",
               {{"source", source_path}, {"path", new_path}});
  const auto file_id = Allocate();
  Open(file_id, new_path, commit_oid);
  return file_id;
}

FileId FileIdentityResolver::RecordDeletion(const std::string &path,
                                            const std::string &commit_oid) {
  CheckCommit(commit_oid);
  if (const auto owner = current_.find(path); owner != current_.end()) {
    const auto file_id = owner->second;
    Close(file_id, commit_oid);
    moved_by_rename_.erase(file_id);
    return file_id;
  }
  if (const auto last = historical_.find(path); last != historical_.end()) {
    return last->second;
  }
  const auto file_id = Allocate();
  Mutable(file_id).lineage.push_back(
      LineageInterval{path, commit_oid, commit_oid});
  historical_[path] = file_id;
  return file_id;
}

FileId FileIdentityResolver::Apply(const ChangeEntry &entry) {
  switch (entry.status) {
  case ChangeStatus::kAdded:
  case ChangeStatus::kModified:
  case ChangeStatus::kTypeChanged:
    return Resolve(entry.new_path, entry.commit_oid);
  case ChangeStatus::kDeleted:
    return RecordDeletion(entry.new_path, entry.commit_oid);
  case ChangeStatus::kRenamed:
    if (!entry.old_path) {
      return Resolve(entry.new_path, entry.commit_oid);
    }
    return RecordRename(*entry.old_path, entry.new_path, entry.commit_oid);
  case ChangeStatus::kCopied:
    return RecordCopy(entry.old_path.value_or(std::string()), entry.new_path,
                      entry.commit_oid);
  }
  throw std::logic_error("Unhandled change status");
}

std::optional<FileId>
FileIdentityResolver::FindByPath(const std::string &path) const {
  if (const auto owner = current_.find(path); owner != current_.end()) {
    return owner->second;
  }
  if (const auto last = historical_.find(path); last != historical_.end()) {
    return last->second;
  }
  return std::nullopt;
}

std::vector<std::pair<std::string, FileId>>
FileIdentityResolver::CurrentPaths() const {
  std::vector<std::pair<std::string, FileId>> paths(current_.begin(),
                                                    current_.end());
  std::sort(paths.begin(), paths.end());
  return paths;
}

std::vector<PathOwner> FileIdentityResolver::PathIndex() const {
  std::vector<PathOwner> owners;
  owners.reserve(historical_.size());
  for (const auto &[path, file_id] : historical_) {
    const auto current = current_.find(path);
    if (current != current_.end()) {
      owners.push_back(PathOwner{path, current->second, true});
    } else {
      owners.push_back(PathOwner{path, file_id, false});
    }
  }
  std::sort(owners.begin(), owners.end(),
            [](const PathOwner &left, const PathOwner &right) {
              return left.path < right.path;
            });
  return owners;
}

bool FileIdentityResolver::VerifyNoOverlap() const {
  std::unordered_map<std::string, FileId> open_owner;
  for (const auto &identity : identities_) {
    std::size_t open = 0;
    for (const auto &interval : identity.lineage) {
      if (!interval.IsOpen()) {
        continue;
      }
      ++open;
      if (!open_owner.emplace(interval.path, identity.file_id).second) {
        return false;
      }
    }
    if (open > 1) {
      return false;
    }
  }
  return open_owner.size() == current_.size();
}

} // namespace cochange
