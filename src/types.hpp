#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/PaneId/keys/Viewport).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <cstdint>

enum class Mode { Normal, Jump, Dataset, Window, Plot, Histogram, AwaitingInput };

enum class PaneId { Tree, Metadata, Attributes, Values, Plot, Histogram, Hotkeys, Progress, Prompt, MiniBuffer };
constexpr int PANE_COUNT = 10;

enum class NodeKind { Container, Leaf };

using NodeId = std::size_t;
constexpr NodeId NO_NODE = static_cast<NodeId>(-1);

struct Viewport { int top_line = 0; int left_col = 0; };

// half-open index range along the first axis of a dataset
struct IndexRange { std::uint64_t start = 0; std::uint64_t end = 0; };

// key codes delivered by ITerminal::read_key; terminal specific codes are mapped onto these
constexpr int K_NONE = -1;
constexpr int K_CTRL_C = 'C' - 64;
constexpr int K_BACKSPACE = 127;
constexpr int K_ESC = 27;
constexpr int K_ENTER = '\n';
constexpr int K_UP = 0x1001;
constexpr int K_DOWN = 0x1002;
constexpr int K_LEFT = 0x1003;
constexpr int K_RIGHT = 0x1004;
constexpr int K_HOME = 0x1005;
constexpr int K_END = 0x1006;
constexpr int K_PAGE_UP = 0x1007;
constexpr int K_PAGE_DOWN = 0x1008;
constexpr int K_MOUSE = 0x1009;
constexpr int K_RESIZE = 0x100a;

struct MouseEvent {
  enum class Type { None, Click, WheelUp, WheelDown };
  Type type = Type::None;
  int row = 0;
  int col = 0;
};

inline const char* mode_name(Mode m) {
  switch (m) {
    case Mode::Normal: return "NORMAL";
    case Mode::Jump: return "JUMP";
    case Mode::Dataset: return "DATASET";
    case Mode::Window: return "WINDOW";
    case Mode::Plot: return "PLOT";
    case Mode::Histogram: return "HISTOGRAM";
    case Mode::AwaitingInput: return "INPUT";
  }
  return "?";
}
