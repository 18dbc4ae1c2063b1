#pragma once
#include <deque>
#include <functional>
#include <string>

namespace cs {

// Inverse pair for one user-facing operation on the drawing collection.
struct UndoableAction {
  std::string description;             // e.g. "Add TrendLine"
  std::function<void()> execute;       // do / redo
  std::function<void()> undo;
};

struct HistoryConfig {
  std::size_t maxDepth{100};  // oldest undo entries are dropped past this
};

// Bounded undo/redo stack. A new action invalidates the redo branch.
class CommandHistory {
public:
  void setConfig(const HistoryConfig& cfg);
  const HistoryConfig& config() const { return config_; }

  // Called after every change to either stack.
  void setOnChange(std::function<void()> cb) { onChange_ = std::move(cb); }

  // Run action.execute() and push it.
  void execute(UndoableAction action);

  // Push an action whose forward step has already been applied.
  void record(UndoableAction action);

  // Returns true if an action was undone / redone.
  bool undo();
  bool redo();

  bool canUndo() const { return !undoStack_.empty(); }
  bool canRedo() const { return !redoStack_.empty(); }
  std::size_t undoCount() const { return undoStack_.size(); }
  std::size_t redoCount() const { return redoStack_.size(); }

  void clear();

  // Empty string if the respective stack is empty.
  const std::string& undoDescription() const;
  const std::string& redoDescription() const;

private:
  void push(UndoableAction action);
  bool trimNeeded() const;
  void trim();
  void changed();

  HistoryConfig config_;
  std::deque<UndoableAction> undoStack_;
  std::deque<UndoableAction> redoStack_;
  std::function<void()> onChange_;
  static const std::string empty_;
};

} // namespace cs
