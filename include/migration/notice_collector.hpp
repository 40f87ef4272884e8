#pragma once

#include "util/notes_output.hpp"

#include <string>
#include <utility>
#include <vector>

namespace sysupdate {

// Messages reported by migrations and seeders, grouped by source in the
// order sources first reported.
class NoticeCollector {
  public:
    void Add(const std::string& source, const std::string& message);
    void Add(const std::string& source, const std::vector<std::string>& messages);

    bool Empty() const { return groups_.empty(); }
    const std::vector<std::pair<std::string, std::vector<std::string>>>& Groups() const { return groups_; }

    // A blank line, then "<source> reported:" followed by " - <message>" lines.
    void Print(INotesOutput* out) const;
    void Clear() { groups_.clear(); }

  private:
    std::vector<std::pair<std::string, std::vector<std::string>>> groups_;
};

} // namespace sysupdate
