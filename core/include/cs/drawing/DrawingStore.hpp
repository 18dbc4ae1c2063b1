#pragma once
#include "cs/drawing/Drawing.hpp"
#include <cstdint>
#include <vector>

namespace cs {

// Insertion-ordered collection of committed drawings. Order is z-order:
// later entries paint on top and win hit tests.
class DrawingStore {
public:
  // Assign a fresh id and append. Returns the id.
  DrawingId add(Drawing d);

  // Re-insert a drawing that already carries an id (undo of a removal).
  // `index` is clamped to the current size. Returns false if the id is
  // invalid or already present.
  bool insertAt(std::size_t index, Drawing d);

  // Returns false if the id is not present.
  bool remove(DrawingId id);
  void clear();

  const Drawing* get(DrawingId id) const;
  bool contains(DrawingId id) const { return get(id) != nullptr; }

  // Position in z-order, or count() when absent.
  std::size_t indexOf(DrawingId id) const;

  const std::vector<Drawing>& drawings() const { return drawings_; }
  std::size_t count() const { return drawings_.size(); }
  bool empty() const { return drawings_.empty(); }

private:
  std::vector<Drawing> drawings_;
  DrawingId nextId_{1};
};

} // namespace cs
