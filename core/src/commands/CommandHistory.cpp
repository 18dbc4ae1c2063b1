#include "cs/commands/CommandHistory.hpp"

namespace cs {

const std::string CommandHistory::empty_;

void CommandHistory::setConfig(const HistoryConfig& cfg) {
  config_ = cfg;
  if (trimNeeded()) {
    trim();
    changed();
  }
}

bool CommandHistory::trimNeeded() const {
  return undoStack_.size() > config_.maxDepth;
}

void CommandHistory::execute(UndoableAction action) {
  if (action.execute) action.execute();
  push(std::move(action));
}

void CommandHistory::record(UndoableAction action) {
  push(std::move(action));
}

void CommandHistory::push(UndoableAction action) {
  undoStack_.push_back(std::move(action));
  redoStack_.clear();
  trim();
  changed();
}

void CommandHistory::trim() {
  while (trimNeeded()) undoStack_.pop_front();
}

bool CommandHistory::undo() {
  if (undoStack_.empty()) return false;
  UndoableAction action = std::move(undoStack_.back());
  undoStack_.pop_back();
  if (action.undo) action.undo();
  redoStack_.push_back(std::move(action));
  changed();
  return true;
}

bool CommandHistory::redo() {
  if (redoStack_.empty()) return false;
  UndoableAction action = std::move(redoStack_.back());
  redoStack_.pop_back();
  if (action.execute) action.execute();
  undoStack_.push_back(std::move(action));
  changed();
  return true;
}

void CommandHistory::clear() {
  if (undoStack_.empty() && redoStack_.empty()) return;
  undoStack_.clear();
  redoStack_.clear();
  changed();
}

const std::string& CommandHistory::undoDescription() const {
  return undoStack_.empty() ? empty_ : undoStack_.back().description;
}

const std::string& CommandHistory::redoDescription() const {
  return redoStack_.empty() ? empty_ : redoStack_.back().description;
}

void CommandHistory::changed() {
  if (onChange_) onChange_();
}

} // namespace cs
