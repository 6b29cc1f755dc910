#include "app.hpp"
#include "errors.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <chrono>

App::App(IReader& reader, const Settings& settings, ITerminal& term)
    : settings_(settings), term_(term), store_(reader, settings.values_cap), tree_(store_),
      cursor_(tree_, store_, display_, session_), modes_(display_), hist_(settings.hist_bins) {
  root_ = store_.create_root();
  tree_.initialize(root_);
  display_.set_pane_title(PaneId::Tree, store_.at(root_).name);
  display_.set_pane_title(PaneId::Metadata, "Metadata");
  display_.set_pane_title(PaneId::Attributes, "Attributes");
  display_.set_pane_title(PaneId::Values, "Values");
  display_.set_pane_title(PaneId::Plot, "Plot");
  display_.set_pane_title(PaneId::Histogram, "Histogram");
  register_bindings();
  print(std::string("Welcome to h5forest! (v") + H5F_VERSION + ")");
}

App::~App() {
  job_.request_stop();
  poll_.request_stop();
}

void App::run() {
  term_.enable_mouse(settings_.mouse);
  poll_ = std::jthread([this](std::stop_token st) {
    cursor_.poll_loop(st, std::chrono::milliseconds(settings_.poll_ms));
  });
  spdlog::info("event loop started on {}", store_.at(root_).name);
  try {
    while (true) {
      if (display_.take_invalidated()) render_frame();
      int ch = term_.read_key(settings_.poll_ms);
      if (ch == K_NONE) continue;
      if (ch == K_RESIZE) { display_.invalidate(); continue; }
      handle_key(ch);
    }
  } catch (const QuitRequested&) {
    spdlog::info("quit requested");
  }
}

void App::handle_key(int ch) {
  std::lock_guard<std::mutex> lk(session_);
  if (ch == K_CTRL_C) throw QuitRequested{};
  if (ch == K_MOUSE) {
    if (!modes_.awaiting_input()) modes_.run_guarded([this] { handle_mouse(); });
  } else if (!modes_.handle_key(ch)) {
    spdlog::trace("unbound key {} in {}", ch, mode_name(modes_.mode()));
  }
  display_.invalidate();
}

std::vector<std::string> App::current_hints() const {
  if (modes_.awaiting_input()) return {"Enter -> Submit", "Esc -> Cancel"};
  return modes_.hints(modes_.mode());
}

std::vector<PaneRect> App::layout_rects() const {
  TermSize sz = term_.getSize();
  LayoutFlags flags;
  flags.attributes_expanded = attributes_expanded_;
  flags.lower_pane = lower_;
  flags.progress = job_running_.load();
  flags.hotkey_rows = std::clamp((int)Renderer::pack_hints(current_hints(), sz.cols - 2).size(), 1, 4);
  auto root = build_layout(flags);
  std::vector<PaneRect> rects;
  collect_layout(*root, Rect{0, 0, sz.rows, sz.cols}, rects);
  return rects;
}

void App::render_frame() {
  std::lock_guard<std::mutex> lk(session_);
  std::vector<PaneRect> rects = layout_rects();
  PaneId focus = display_.focused();
  FrameRenderInfo f;
  f.tree = &tree_;
  f.tree_title = display_.pane_title(PaneId::Tree);
  f.cursor_row = cursor_.current_row();
  f.cursor_col = cursor_.current_col();
  f.tree_vp = &tree_vp_;
  f.tree_active = focus == PaneId::Tree;
  for (const auto& pr : rects) {
    PaneId id = static_cast<PaneId>(pr.pane);
    switch (id) {
      case PaneId::Tree:
        f.tree_area = pr.rect;
        tree_rows_ = std::max(1, pr.rect.height - 2);
        break;
      case PaneId::Hotkeys: f.hotkeys_area = pr.rect; break;
      case PaneId::Progress: f.progress_area = pr.rect; break;
      case PaneId::MiniBuffer: f.mini_area = pr.rect; break;
      default: {
        PaneRenderInfo p;
        p.pane = id;
        p.area = pr.rect;
        p.title = display_.pane_title(id);
        p.scroll = &scroll_[static_cast<size_t>(pr.pane)];
        p.is_active = focus == id;
        int w = std::max(1, pr.rect.width - 2), h = std::max(1, pr.rect.height - 2);
        if (id == PaneId::Plot) p.text = plot_drawn_ ? density_.render(w, h) : density_.config_text();
        else if (id == PaneId::Histogram) p.text = hist_drawn_ ? hist_.render(w, h) : hist_.config_text();
        else p.text = display_.pane_text(id);
        f.panes.push_back(std::move(p));
      } break;
    }
  }
  f.hints = current_hints();
  if (job_running_.load()) {
    f.progress = progress_.load();
    f.progress_label = progress_label_;
  }
  f.mini_title = mode_name(modes_.mode());
  f.awaiting_input = modes_.awaiting_input();
  f.prompt = modes_.prompt();
  f.mini_text = f.awaiting_input ? modes_.input().text() : display_.pane_text(PaneId::MiniBuffer);
  f.input_cursor = modes_.input().cursor();
  renderer_.render(term_, f);
}

void App::handle_mouse() {
  if (!settings_.mouse) return;
  MouseEvent ev = term_.last_mouse();
  const int wheel_step = 3;
  for (const auto& pr : layout_rects()) {
    if (!pr.rect.contains(ev.row, ev.col)) continue;
    PaneId id = static_cast<PaneId>(pr.pane);
    if (id == PaneId::Tree) {
      if (ev.type == MouseEvent::Type::WheelUp) cursor_.move_rows(-wheel_step);
      else if (ev.type == MouseEvent::Type::WheelDown) cursor_.move_rows(wheel_step);
      else if (ev.type == MouseEvent::Type::Click) {
        int r = ev.row - pr.rect.row - 1;
        if (r >= 0 && r < pr.rect.height - 2) cursor_.move_to_row(tree_vp_.top_line + r);
        display_.focus(PaneId::Tree);
      }
    } else if (id == PaneId::Metadata || id == PaneId::Attributes || id == PaneId::Values ||
               id == PaneId::Plot || id == PaneId::Histogram) {
      int& sc = scroll_[static_cast<size_t>(pr.pane)];
      if (ev.type == MouseEvent::Type::WheelUp) sc = std::max(0, sc - wheel_step);
      else if (ev.type == MouseEvent::Type::WheelDown) sc += wheel_step;
      else if (ev.type == MouseEvent::Type::Click) display_.focus(id);
    }
    return;
  }
}

NodeId App::node_under_cursor() { return tree_.node_at_row(cursor_.current_row()); }

void App::toggle_node() {
  int row = cursor_.current_row();
  NodeId id = tree_.node_at_row(row);
  const Node& n = store_.at(id);
  if (!n.is_container()) { modes_.print(n.path + " is not a Group"); return; }
  if (!n.has_children) { modes_.print(n.path + " has no children"); return; }
  if (n.is_expanded) tree_.collapse_node(id, row);
  else tree_.expand_node(id, row);
  cursor_.reposition(cursor_.offset_of_row_start(row));
  cursor_.mark_dirty();
}

void App::scroll_focused(int delta) {
  int& sc = scroll_[static_cast<size_t>(display_.focused())];
  sc = std::max(0, sc + delta);
  display_.invalidate();
}

void App::move_down(int n) {
  if (display_.focused() == PaneId::Tree) cursor_.move_rows(n);
  else scroll_focused(n);
}

void App::move_up(int n) {
  if (display_.focused() == PaneId::Tree) cursor_.move_rows(-n);
  else scroll_focused(-n);
}

void App::jump_to_parent() {
  const Node& n = store_.at(node_under_cursor());
  if (n.parent == NO_NODE) throw InvalidUserInput(n.path + " has no parent");
  cursor_.move_to_row(tree_.row_of_node(n.parent));
}

void App::jump_to_next_sibling() {
  int row = cursor_.current_row();
  NodeId id = tree_.node_at_row(row);
  int depth = store_.at(id).depth;
  for (int r = row + 1; r < tree_.row_count(); ++r) {
    int d = store_.at(tree_.node_at_row(r)).depth;
    if (d < depth) break;
    if (d == depth) { cursor_.move_to_row(r); return; }
  }
  throw InvalidUserInput(store_.at(id).path + " has no next sibling");
}

void App::jump_to_match(const std::string& needle) {
  if (needle.empty()) throw InvalidUserInput("nothing to search for");
  int rows = tree_.row_count();
  int row = cursor_.current_row();
  for (int k = 1; k <= rows; ++k) {
    int r = (row + k) % rows;
    if (store_.at(tree_.node_at_row(r)).name.find(needle) != std::string::npos) {
      cursor_.move_to_row(r);
      return;
    }
  }
  throw InvalidUserInput("no open node matches '" + needle + "'");
}

NodeId App::dataset_under_cursor(DatasetInfo* info, bool need_numeric) {
  NodeId id = node_under_cursor();
  const Node& n = store_.at(id);
  if (n.is_container()) throw InvalidUserInput(n.path + " is not a Dataset");
  DatasetInfo di = store_.reader().dataset_info(n.path);
  if (need_numeric && !di.numeric) throw InvalidUserInput(n.path + " holds " + di.dtype + ", not numbers");
  if (info) *info = std::move(di);
  return id;
}

void App::show_lower(PaneId pane) {
  lower_ = static_cast<int>(pane);
  scroll_[static_cast<size_t>(pane)] = 0;
  display_.invalidate();
}

void App::show_values(NodeId id, std::optional<IndexRange> range) {
  std::string text = store_.value_text(id, range);
  std::string title = "Values: " + store_.at(id).path;
  if (range) title += fmt::format(" [{}, {})", range->start, range->end);
  display_.set_pane_title(PaneId::Values, std::move(title));
  display_.set_pane_text(PaneId::Values, std::move(text));
  show_lower(PaneId::Values);
}

void App::close_values() {
  if (lower_ == static_cast<int>(PaneId::Values)) lower_ = -1;
  display_.set_pane_text(PaneId::Values, "");
  if (display_.focused() == PaneId::Values) display_.focus(PaneId::Tree);
}

void App::focus_pane(PaneId pane) {
  if ((pane == PaneId::Values || pane == PaneId::Plot || pane == PaneId::Histogram) && lower_ != static_cast<int>(pane)) {
    throw InvalidUserInput(display_.pane_title(pane) + " pane is not open");
  }
  display_.focus(pane);
}

void App::restore_layout() {
  attributes_expanded_ = false;
  scroll_.fill(0);
  tree_vp_ = Viewport{};
  display_.focus(PaneId::Tree);
}

bool App::start_job(std::string label, std::function<void(std::stop_token)> body) {
  if (job_running_.load()) {
    modes_.print("ERROR: " + progress_label_ + " is still running");
    return false;
  }
  if (job_.joinable()) job_.join();
  job_running_.store(true);
  progress_.store(0.0);
  progress_label_ = label;
  spdlog::info("job started: {}", label);
  job_ = std::jthread([this, label, body = std::move(body)](std::stop_token st) {
    try {
      body(st);
    } catch (const std::exception& e) {
      spdlog::warn("job failed: {}: {}", label, e.what());
      display_.set_pane_text(PaneId::MiniBuffer, std::string("ERROR: ") + e.what());
    }
    spdlog::info("job finished: {}", label);
    job_running_.store(false);
    display_.invalidate();
  });
  return true;
}

void App::wait_for_job() {
  if (job_.joinable()) job_.join();
}

std::vector<double> App::fetch_numeric(const std::string& path, const DatasetInfo& info, std::stop_token stop,
                                       RunningStats* stats) {
  std::vector<double> out;
  std::uint64_t n = info.length();
  std::uint64_t step = std::max<std::uint64_t>(1, settings_.chunk_elements / std::max<std::uint64_t>(1, info.row_size()));
  for (std::uint64_t s = 0; s < n; s += step) {
    if (stop.stop_requested()) {
      spdlog::info("read of {} stopped at row {}", path, s);
      break;
    }
    std::uint64_t e = std::min(n, s + step);
    std::vector<double> chunk;
    {
      std::lock_guard<std::mutex> lk(session_);
      chunk = store_.reader().read_numeric(path, s, e);
    }
    if (stats) stats->add(chunk);
    else out.insert(out.end(), chunk.begin(), chunk.end());
    progress_.store(static_cast<double>(e) / static_cast<double>(n));
    display_.invalidate();
  }
  return out;
}

void App::start_stats(char which) {
  DatasetInfo info;
  std::string path = store_.at(dataset_under_cursor(&info, true)).path;
  start_job("Statistics of " + path, [this, path, info, which](std::stop_token st) {
    RunningStats stats;
    fetch_numeric(path, info, st, &stats);
    if (st.stop_requested()) return;
    std::string msg;
    if (stats.count == 0) msg = path + ": no finite values";
    else if (which == 'm') msg = fmt::format("{}: min = {:.6g}, max = {:.6g}", path, stats.min, stats.max);
    else if (which == 'M') msg = fmt::format("{}: mean = {:.6g}", path, stats.mean());
    else msg = fmt::format("{}: std = {:.6g}", path, stats.stddev());
    if (stats.skipped) msg += fmt::format(" ({} non-finite skipped)", stats.skipped);
    display_.set_pane_text(PaneId::MiniBuffer, msg);
  });
}

void App::select_axis(char axis) {
  DatasetInfo info;
  std::string path = store_.at(dataset_under_cursor(&info, true)).path;
  start_job("Reading " + path, [this, path, info, axis](std::stop_token st) {
    std::vector<double> data = fetch_numeric(path, info, st, nullptr);
    if (st.stop_requested()) return;
    std::lock_guard<std::mutex> lk(session_);
    if (axis == 'x') density_.set_x(path, std::move(data));
    else density_.set_y(path, std::move(data));
    plot_drawn_ = false;
    display_.set_pane_text(PaneId::MiniBuffer, std::string(1, axis) + "-axis set to " + path);
  });
}

void App::select_histogram_data() {
  DatasetInfo info;
  std::string path = store_.at(dataset_under_cursor(&info, true)).path;
  start_job("Reading " + path, [this, path, info](std::stop_token st) {
    std::vector<double> data = fetch_numeric(path, info, st, nullptr);
    if (st.stop_requested()) return;
    std::lock_guard<std::mutex> lk(session_);
    hist_.set_data(path, std::move(data));
    hist_drawn_ = false;
    display_.set_pane_text(PaneId::MiniBuffer, "histogram data set to " + path);
  });
}
