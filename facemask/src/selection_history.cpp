#include "selection_history.hpp"

#include <algorithm>

namespace facemask {

namespace {
// Clears the flag on every exit path, including a throwing listener.
struct NavigationGuard {
    explicit NavigationGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~NavigationGuard() { flag_ = false; }
    bool& flag_;
};
}  // namespace

bool SelectionHistory::commit(const FaceSet& faces) {
    if (faces.empty() || navigating_) return false;
    entries_.erase(entries_.begin() + (cursor_ + 1), entries_.end());
    entries_.push_back(faces);
    cursor_ = static_cast<int>(entries_.size()) - 1;
    return true;
}

std::optional<FaceSet> SelectionHistory::navigate_to(int index) {
    cursor_ = index;
    FaceSet restored = entries_[index];
    if (listener_) {
        NavigationGuard guard(navigating_);
        listener_(restored);
    }
    return restored;
}

std::optional<FaceSet> SelectionHistory::undo() {
    if (!can_undo()) return std::nullopt;
    return navigate_to(cursor_ - 1);
}

std::optional<FaceSet> SelectionHistory::redo() {
    if (!can_redo()) return std::nullopt;
    return navigate_to(cursor_ + 1);
}

void SelectionHistory::reset() {
    entries_.clear();
    cursor_ = -1;
}

std::optional<FaceSet> SelectionHistory::current() const {
    if (cursor_ < 0) return std::nullopt;
    return entries_[cursor_];
}

FaceSet merge_include(const FaceSet& current, const FaceSet& found, const DuplicateResolver& resolver) {
    FaceSet merged = current;
    for (const auto& f : found) {
        bool covered = std::any_of(merged.begin(), merged.end(),
                                   [&](const FaceRegion& m) { return resolver.is_duplicate(f, m); });
        if (!covered) merged.push_back(f);
    }
    return merged;
}

FaceSet merge_exclude(const FaceSet& current, const FaceSet& found, const DuplicateResolver& resolver) {
    FaceSet kept;
    for (const auto& c : current) {
        bool removed = std::any_of(found.begin(), found.end(),
                                   [&](const FaceRegion& f) { return iou(c, f) > resolver.iou_threshold(); });
        if (!removed) kept.push_back(c);
    }
    return kept;
}

}  // namespace facemask
