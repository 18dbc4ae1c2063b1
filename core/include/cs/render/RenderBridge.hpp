#pragma once
#include "cs/drawing/Drawing.hpp"

#include <cstddef>

namespace cs {

class Tool;

// Connects drawings to whatever paints them. The manager talks only to
// this interface.
class RenderBridge {
public:
  virtual ~RenderBridge() = default;

  // Paint a committed drawing (copied) with `tool` until detached.
  // Re-attaching an id replaces the previous copy in place.
  virtual void attach(const Drawing& drawing, const Tool& tool) = 0;
  virtual bool detach(DrawingId id) = 0;
  virtual void detachAll() = 0;

  // The in-progress drawing, read live each paint and painted on top.
  // The caller keeps `drawing` alive until clearPreview().
  virtual void setPreview(const Drawing* drawing, const Tool* tool) = 0;
  virtual void clearPreview() = 0;

  virtual void requestRepaint() = 0;
  virtual std::size_t attachedCount() const = 0;
};

} // namespace cs
