#include "migration/notice_collector.hpp"

namespace sysupdate {

void NoticeCollector::Add(const std::string& source, const std::string& message) {
    if (message.empty()) return;

    for (auto& [name, messages] : groups_) {
        if (name == source) {
            messages.push_back(message);
            return;
        }
    }
    groups_.emplace_back(source, std::vector<std::string>{message});
}

void NoticeCollector::Add(const std::string& source, const std::vector<std::string>& messages) {
    for (const auto& m : messages) Add(source, m);
}

void NoticeCollector::Print(INotesOutput* out) const {
    if (!out || groups_.empty()) return;

    out->WriteLine("");
    for (const auto& [source, messages] : groups_) {
        out->WriteLine(source + " reported:");
        for (const auto& m : messages) out->WriteLine(" - " + m);
    }
}

} // namespace sysupdate
