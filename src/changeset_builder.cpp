#include <cochange/changeset_builder.h>

#include <algorithm>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace cochange {

ChangesetBuilder::ChangesetBuilder(ChangesetMode mode, int max_changeset_size)
    : mode_(mode) {
  if (max_changeset_size < 1) {
    throw std::invalid_argument("max_changeset_size must be >= 1");
  }
  max_changeset_size_ = static_cast<std::size_t>(max_changeset_size);
}

std::vector<Changeset>
ChangesetBuilder::Add(const Commit &commit,
                      const std::vector<FileId> &file_ids) {
  return std::visit(
      [&](const auto &mode) -> std::vector<Changeset> {
        using Mode = std::decay_t<decltype(mode)>;
        if constexpr (std::is_same_v<Mode, ByCommit>) {
          Changeset changeset;
          changeset.key = commit.oid;
          changeset.mode = ChangesetModeName(mode_);
          changeset.files = file_ids;
          changeset.commit_oids.push_back(commit.oid);
          changeset.start_ts = commit.committer_ts;
          changeset.end_ts = commit.committer_ts;
          std::vector<Changeset> finished;
          finished.push_back(Finalize(std::move(changeset)));
          return finished;
        } else {
          static_assert(std::is_same_v<Mode, ByAuthorTime>);
          return AddToAuthorGroup(commit, file_ids, mode.window_hours);
        }
      },
      mode_);
}

std::vector<Changeset>
ChangesetBuilder::AddToAuthorGroup(const Commit &commit,
                                   const std::vector<FileId> &file_ids,
                                   double window_hours) {
  const auto window_seconds = window_hours * 3600.0;
  std::vector<Changeset> expired;
  for (auto it = open_groups_.begin(); it != open_groups_.end();) {
    const auto deadline = static_cast<double>(it->second.start_ts) +
                          window_seconds;
    if (static_cast<double>(commit.committer_ts) > deadline) {
      expired.push_back(std::move(it->second));
      it = open_groups_.erase(it);
    } else {
      ++it;
    }
  }

  auto [group, inserted] =
      open_groups_.try_emplace(commit.author_email, Changeset{});
  auto &changeset = group->second;
  if (inserted) {
    changeset.key =
        commit.author_email + "@" + std::to_string(commit.committer_ts);
    changeset.mode = ChangesetModeName(mode_);
    changeset.start_ts = commit.committer_ts;
    changeset.end_ts = commit.committer_ts;
  }
  changeset.files.insert(changeset.files.end(), file_ids.begin(),
                         file_ids.end());
  changeset.commit_oids.push_back(commit.oid);
  changeset.end_ts = std::max(changeset.end_ts, commit.committer_ts);
  return EmitSorted(std::move(expired));
}

std::vector<Changeset> ChangesetBuilder::Flush() {
  std::vector<Changeset> remaining;
  for (auto &[author, changeset] : open_groups_) {
    remaining.push_back(std::move(changeset));
  }
  open_groups_.clear();
  return EmitSorted(std::move(remaining));
}

std::vector<Changeset>
ChangesetBuilder::EmitSorted(std::vector<Changeset> changesets) {
  std::sort(changesets.begin(), changesets.end(),
            [](const Changeset &left, const Changeset &right) {
              if (left.start_ts != right.start_ts) {
                return left.start_ts < right.start_ts;
              }
              return left.key < right.key;
            });
  for (auto &changeset : changesets) {
    changeset = Finalize(std::move(changeset));
  }
  return changesets;
}

Changeset ChangesetBuilder::Finalize(Changeset changeset) {
  std::sort(changeset.files.begin(), changeset.files.end());
  changeset.files.erase(
      std::unique(changeset.files.begin(), changeset.files.end()),
      changeset.files.end());
  changeset.size = changeset.files.size();
  changeset.excluded_from_coupling = changeset.size > max_changeset_size_;

  ++counters_.changesets;
  counters_.touched_files += changeset.size;
  if (changeset.excluded_from_coupling) {
    ++counters_.excluded_changesets;
    counters_.excluded_touched_files += changeset.size;
  }
  return changeset;
}

} // namespace cochange
