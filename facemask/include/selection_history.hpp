#pragma once

#include <functional>
#include <optional>
#include <vector>

#include "duplicate_resolver.hpp"
#include "face_types.hpp"

namespace facemask {

// Linear undo/redo over committed FaceSets. Committing after an undo drops
// the entries past the cursor.
class SelectionHistory {
public:
    using NavigationListener = std::function<void(const FaceSet&)>;

    // Returns true when an entry was recorded. Empty sets and commits made
    // while undo/redo is running are ignored.
    bool commit(const FaceSet& faces);

    std::optional<FaceSet> undo();
    std::optional<FaceSet> redo();
    void reset();

    bool can_undo() const { return cursor_ > 0; }
    bool can_redo() const { return cursor_ + 1 < static_cast<int>(entries_.size()); }
    std::size_t size() const { return entries_.size(); }
    int cursor() const { return cursor_; }
    std::optional<FaceSet> current() const;

    // Called with the restored set on every undo/redo.
    void set_navigation_listener(NavigationListener listener) { listener_ = std::move(listener); }

private:
    std::optional<FaceSet> navigate_to(int index);

    std::vector<FaceSet> entries_;
    int cursor_{-1};
    bool navigating_{false};
    NavigationListener listener_;
};

// `current` plus every face in `found` that is not already covered.
FaceSet merge_include(const FaceSet& current, const FaceSet& found, const DuplicateResolver& resolver);

// `current` minus every face overlapping one in `found` by more than the resolver's IoU threshold.
FaceSet merge_exclude(const FaceSet& current, const FaceSet& found, const DuplicateResolver& resolver);

}  // namespace facemask
