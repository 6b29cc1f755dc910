#pragma once
/*
 * App
 *
 * Purpose: the application context. Owns the node store, tree text, display
 * state, cursor sync, mode controller, plotters and worker threads for one
 * open file, registers the key bindings and runs the event loop.
 * Threading: handle_key(), render_frame() and every job chunk take session_;
 * the poll thread does the same inside CursorSync::poll_once().
 */
#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "types.hpp"
#include "settings.hpp"
#include "i_reader.hpp"
#include "node.hpp"
#include "tree_text.hpp"
#include "display_state.hpp"
#include "cursor_sync.hpp"
#include "mode_controller.hpp"
#include "plotting.hpp"
#include "stats.hpp"
#include "renderer.hpp"
#include "iterminal.hpp"
#include "pane_layout.hpp"

class App {
public:
  App(IReader& reader, const Settings& settings, ITerminal& term);
  ~App();
  void run();

  void handle_key(int ch);
  void render_frame();
  void print(const std::string& msg) { display_.set_pane_text(PaneId::MiniBuffer, msg); }
  bool poll_now() { return cursor_.poll_once(); }
  bool job_running() const { return job_running_.load(); }
  void wait_for_job();

  ModeController& modes() { return modes_; }
  TreeText& tree() { return tree_; }
  NodeStore& store() { return store_; }
  CursorSync& cursor() { return cursor_; }
  DisplayState& display() { return display_; }
  int lower_pane() const { return lower_; }

private:
  void register_bindings();
  void handle_mouse();
  std::vector<PaneRect> layout_rects() const;
  std::vector<std::string> current_hints() const;

  // tree navigation
  NodeId node_under_cursor();
  void toggle_node();
  void move_down(int n);
  void move_up(int n);
  void scroll_focused(int delta);
  void jump_to_parent();
  void jump_to_next_sibling();
  void jump_to_match(const std::string& needle);

  // datasets and plots
  NodeId dataset_under_cursor(DatasetInfo* info, bool need_numeric);
  void show_values(NodeId id, std::optional<IndexRange> range);
  void close_values();
  void start_stats(char which);
  void select_axis(char axis);
  void select_histogram_data();
  void show_lower(PaneId pane);
  void focus_pane(PaneId pane);
  void restore_layout();

  // background work; refused while another job is in flight
  bool start_job(std::string label, std::function<void(std::stop_token)> body);
  std::vector<double> fetch_numeric(const std::string& path, const DatasetInfo& info, std::stop_token stop,
                                    RunningStats* stats);

  Settings settings_;
  ITerminal& term_;
  std::mutex session_;
  NodeStore store_;
  TreeText tree_;
  DisplayState display_;
  CursorSync cursor_;
  ModeController modes_;
  Renderer renderer_;
  HistogramPlotter hist_;
  DensityPlotter density_;
  NodeId root_ = NO_NODE;
  Viewport tree_vp_;
  std::array<int, PANE_COUNT> scroll_{};
  bool attributes_expanded_ = false;
  int lower_ = -1;
  bool plot_drawn_ = false;
  bool hist_drawn_ = false;
  int tree_rows_ = 1;
  std::atomic<bool> job_running_{false};
  std::atomic<double> progress_{0.0};
  std::string progress_label_;
  std::jthread job_;
  std::jthread poll_;
};
