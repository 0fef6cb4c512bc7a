#pragma once

#include <cochange/mining_config.h>
#include <cochange/models.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace cochange {

struct ChangesetCounters {
  std::size_t changesets = 0;
  std::size_t excluded_changesets = 0;
  std::size_t touched_files = 0;
  std::size_t excluded_touched_files = 0;
};

// Groups commits into logical changesets. Finished changesets come back
// from Add as soon as they are final and from Flush at end of history.
class ChangesetBuilder {
public:
  ChangesetBuilder(ChangesetMode mode, int max_changeset_size);

  std::vector<Changeset> Add(const Commit &commit,
                             const std::vector<FileId> &file_ids);
  std::vector<Changeset> Flush();

  const ChangesetCounters &Counters() const { return counters_; }
  std::size_t OpenGroups() const { return open_groups_.size(); }

private:
  std::vector<Changeset> AddToAuthorGroup(const Commit &commit,
                                          const std::vector<FileId> &file_ids,
                                          double window_hours);
  std::vector<Changeset> EmitSorted(std::vector<Changeset> changesets);
  Changeset Finalize(Changeset changeset);

  ChangesetMode mode_;
  std::size_t max_changeset_size_;
  std::map<std::string, Changeset> open_groups_;
  ChangesetCounters counters_;
};

} // namespace cochange
