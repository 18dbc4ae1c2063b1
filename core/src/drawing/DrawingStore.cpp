#include "cs/drawing/DrawingStore.hpp"
#include <algorithm>

namespace cs {

DrawingId DrawingStore::add(Drawing d) {
  d.id = nextId_++;
  drawings_.push_back(std::move(d));
  return drawings_.back().id;
}

bool DrawingStore::insertAt(std::size_t index, Drawing d) {
  if (d.id == kInvalidDrawingId || contains(d.id)) return false;
  if (index > drawings_.size()) index = drawings_.size();
  if (d.id >= nextId_) nextId_ = d.id + 1;
  drawings_.insert(drawings_.begin() + static_cast<std::ptrdiff_t>(index), std::move(d));
  return true;
}

bool DrawingStore::remove(DrawingId id) {
  auto it = std::remove_if(drawings_.begin(), drawings_.end(),
    [id](const Drawing& d) { return d.id == id; });
  if (it == drawings_.end()) return false;
  drawings_.erase(it, drawings_.end());
  return true;
}

void DrawingStore::clear() {
  drawings_.clear();
}

const Drawing* DrawingStore::get(DrawingId id) const {
  for (const auto& d : drawings_) {
    if (d.id == id) return &d;
  }
  return nullptr;
}

std::size_t DrawingStore::indexOf(DrawingId id) const {
  for (std::size_t i = 0; i < drawings_.size(); ++i) {
    if (drawings_[i].id == id) return i;
  }
  return drawings_.size();
}

} // namespace cs
