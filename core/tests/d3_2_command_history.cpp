// D3.2 — CommandHistory: undo/redo stacks, depth limit, change callback

#include "cs/commands/CommandHistory.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static cs::UndoableAction pushValue(std::vector<int>& v, int value) {
  return {"Push " + std::to_string(value),
          [&v, value] { v.push_back(value); },
          [&v] { v.pop_back(); }};
}

int main() {
  // ---- Test 1: execute / undo / redo ----
  {
    std::vector<int> v;
    cs::CommandHistory h;
    h.execute(pushValue(v, 1));
    h.execute(pushValue(v, 2));
    requireTrue(v.size() == 2, "executed");
    requireTrue(h.undoDescription() == "Push 2", "undo description");

    requireTrue(h.undo(), "undo");
    requireTrue(v.size() == 1 && h.canRedo(), "undone");
    requireTrue(h.redoDescription() == "Push 2", "redo description");
    requireTrue(h.redo(), "redo");
    requireTrue(v.size() == 2 && v[1] == 2, "redone");

    requireTrue(h.undo() && h.undo(), "undo both");
    requireTrue(!h.undo(), "empty undo stack");
    requireTrue(v.empty(), "back to start");
    std::printf("  Test 1 (undo/redo): PASS\n");
  }

  // ---- Test 2: a new action clears redo ----
  {
    std::vector<int> v;
    cs::CommandHistory h;
    h.execute(pushValue(v, 1));
    h.undo();
    requireTrue(h.redoCount() == 1, "redo available");
    h.execute(pushValue(v, 5));
    requireTrue(h.redoCount() == 0 && !h.redo(), "redo branch dropped");
    std::printf("  Test 2 (redo invalidation): PASS\n");
  }

  // ---- Test 3: record does not run the action ----
  {
    std::vector<int> v;
    cs::CommandHistory h;
    v.push_back(7);
    h.record(pushValue(v, 7));
    requireTrue(v.size() == 1, "record did not execute");
    h.undo();
    requireTrue(v.empty(), "undo reverses the recorded change");
    h.redo();
    requireTrue(v.size() == 1 && v[0] == 7, "redo reapplies");
    std::printf("  Test 3 (record): PASS\n");
  }

  // ---- Test 4: depth limit drops the oldest ----
  {
    std::vector<int> v;
    cs::CommandHistory h;
    h.setConfig({3});
    for (int i = 0; i < 5; i++) h.execute(pushValue(v, i));
    requireTrue(h.undoCount() == 3, "bounded");
    while (h.undo()) {}
    requireTrue(v.size() == 2, "oldest two no longer undoable");

    cs::CommandHistory shrink;
    for (int i = 0; i < 4; i++) shrink.execute(pushValue(v, i));
    shrink.setConfig({1});
    requireTrue(shrink.undoCount() == 1, "shrinking trims");
    std::printf("  Test 4 (depth): PASS\n");
  }

  // ---- Test 5: change callback ----
  {
    std::vector<int> v;
    cs::CommandHistory h;
    int changes = 0;
    h.setOnChange([&] { changes++; });
    h.execute(pushValue(v, 1));
    h.undo();
    h.redo();
    requireTrue(changes == 3, "one notification per change");
    requireTrue(!h.redo() && changes == 3, "no-op redo is silent");
    h.clear();
    requireTrue(changes == 4, "clear notifies");
    h.clear();
    requireTrue(changes == 4, "clearing empty history is silent");
    std::printf("  Test 5 (onChange): PASS\n");
  }

  std::printf("D3.2 command_history: ALL PASS\n");
  return 0;
}
