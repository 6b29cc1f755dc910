#include "app.hpp"
#include "errors.hpp"
#include "range_parser.hpp"

void App::register_bindings() {
  auto tree_focused = [this] { return display_.focused() == PaneId::Tree; };
  auto on_dataset = [this] { return !store_.at(node_under_cursor()).is_container(); };
  auto lower_is = [this](PaneId p) { return [this, p] { return lower_ == static_cast<int>(p); }; };
  auto& m = modes_;

  // normal mode
  m.bind(Mode::Normal, K_ENTER, "Enter -> Open/Close Group", [this] { toggle_node(); }, tree_focused);
  m.bind(Mode::Normal, 'j', "j/k -> Down/Up", [this] { move_down(1); });
  m.bind(Mode::Normal, K_DOWN, "", [this] { move_down(1); });
  m.bind(Mode::Normal, 'k', "", [this] { move_up(1); });
  m.bind(Mode::Normal, K_UP, "", [this] { move_up(1); });
  m.bind(Mode::Normal, 'h', "h/l -> Left/Right", [this] { cursor_.move_cols(-1); }, tree_focused);
  m.bind(Mode::Normal, K_LEFT, "", [this] { cursor_.move_cols(-1); }, tree_focused);
  m.bind(Mode::Normal, 'l', "", [this] { cursor_.move_cols(1); }, tree_focused);
  m.bind(Mode::Normal, K_RIGHT, "", [this] { cursor_.move_cols(1); }, tree_focused);
  m.bind(Mode::Normal, '{', "{/} -> Jump Up/Down", [this] { move_up(settings_.jump_step); });
  m.bind(Mode::Normal, '}', "", [this] { move_down(settings_.jump_step); });
  m.bind(Mode::Normal, K_PAGE_UP, "", [this] { move_up(tree_rows_); });
  m.bind(Mode::Normal, K_PAGE_DOWN, "", [this] { move_down(tree_rows_); });
  m.bind(Mode::Normal, 'a', "a -> Expand/Shrink Attributes", [this] {
    attributes_expanded_ = !attributes_expanded_;
    display_.invalidate();
  });
  m.bind(Mode::Normal, 'r', "r -> Restore Layout", [this] { restore_layout(); });
  m.bind(Mode::Normal, 'g', "g -> Goto Mode", [this] { modes_.enter(Mode::Jump); }, tree_focused);
  m.bind(Mode::Normal, 'd', "d -> Dataset Mode", [this] { modes_.enter(Mode::Dataset); }, on_dataset);
  m.bind(Mode::Normal, 'w', "w -> Window Mode", [this] { modes_.enter(Mode::Window); });
  m.bind(Mode::Normal, 'p', "p -> Plotting Mode", [this] {
    modes_.enter(Mode::Plot);
    show_lower(PaneId::Plot);
  });
  m.bind(Mode::Normal, 'H', "H -> Histogram Mode", [this] {
    modes_.enter(Mode::Histogram);
    show_lower(PaneId::Histogram);
  });
  m.bind(Mode::Normal, 'q', "q -> Exit", [] { throw QuitRequested{}; });

  // goto mode
  m.bind(Mode::Jump, 't', "t -> Top", [this] { cursor_.move_to_row(0); modes_.return_to_normal(); });
  m.bind(Mode::Jump, 'b', "b -> Bottom", [this] { cursor_.move_to_row(tree_.row_count() - 1); modes_.return_to_normal(); });
  m.bind(Mode::Jump, 'p', "p -> Parent", [this] { jump_to_parent(); modes_.return_to_normal(); });
  m.bind(Mode::Jump, 'n', "n -> Next Sibling", [this] { jump_to_next_sibling(); modes_.return_to_normal(); });
  m.bind(Mode::Jump, 'K', "K -> Jump to Key", [this] {
    modes_.request_input("Jump to key containing:", [this](const std::string& text) {
      jump_to_match(text);
      modes_.return_to_normal();
    });
  });

  // dataset mode
  m.bind(Mode::Dataset, 'v', "v -> Show Values", [this] {
    show_values(node_under_cursor(), std::nullopt);
    modes_.return_to_normal();
  });
  m.bind(Mode::Dataset, 'V', "V -> Show Values In Range", [this] {
    NodeId id = node_under_cursor();
    modes_.request_input("Enter the index range (start-end):", [this, id](const std::string& text) {
      show_values(id, parse_range(text));
      modes_.return_to_normal();
    });
  });
  m.bind(Mode::Dataset, 'c', "c -> Close Value View", [this] { close_values(); modes_.return_to_normal(); },
         lower_is(PaneId::Values));
  m.bind(Mode::Dataset, 'm', "m -> Minimum and Maximum", [this] { start_stats('m'); modes_.return_to_normal(); });
  m.bind(Mode::Dataset, 'M', "M -> Mean", [this] { start_stats('M'); modes_.return_to_normal(); });
  m.bind(Mode::Dataset, 's', "s -> Standard Deviation", [this] { start_stats('s'); modes_.return_to_normal(); });

  // window mode
  m.bind(Mode::Window, 't', "t -> Move to Tree", [this] { focus_pane(PaneId::Tree); modes_.return_to_normal(); });
  m.bind(Mode::Window, 'a', "a -> Move to Attributes", [this] { focus_pane(PaneId::Attributes); modes_.return_to_normal(); });
  m.bind(Mode::Window, 'm', "m -> Move to Metadata", [this] { focus_pane(PaneId::Metadata); modes_.return_to_normal(); });
  m.bind(Mode::Window, 'v', "v -> Move to Values", [this] { focus_pane(PaneId::Values); modes_.return_to_normal(); },
         lower_is(PaneId::Values));
  m.bind(Mode::Window, 'p', "p -> Move to Plot", [this] { focus_pane(PaneId::Plot); modes_.return_to_normal(); },
         lower_is(PaneId::Plot));
  m.bind(Mode::Window, 'h', "h -> Move to Histogram", [this] { focus_pane(PaneId::Histogram); modes_.return_to_normal(); },
         lower_is(PaneId::Histogram));

  // plotting and histogram modes keep tree navigation so axes can be picked in one visit
  for (Mode pm : {Mode::Plot, Mode::Histogram}) {
    m.bind(pm, 'j', "", [this] { cursor_.move_rows(1); });
    m.bind(pm, K_DOWN, "", [this] { cursor_.move_rows(1); });
    m.bind(pm, 'k', "", [this] { cursor_.move_rows(-1); });
    m.bind(pm, K_UP, "", [this] { cursor_.move_rows(-1); });
  }
  m.bind(Mode::Plot, 'x', "x -> Select x-axis", [this] { select_axis('x'); }, on_dataset);
  m.bind(Mode::Plot, 'y', "y -> Select y-axis", [this] { select_axis('y'); }, on_dataset);
  m.bind(Mode::Plot, 'X', "X -> Toggle x-axis log scale", [this] { density_.toggle_log_x(); });
  m.bind(Mode::Plot, 'Y', "Y -> Toggle y-axis log scale", [this] { density_.toggle_log_y(); });
  m.bind(Mode::Plot, K_ENTER, "Enter -> Plot", [this] {
    density_.check();
    plot_drawn_ = true;
  });
  m.bind(Mode::Plot, 'r', "r -> Reset", [this] {
    density_.reset();
    plot_drawn_ = false;
  });

  m.bind(Mode::Histogram, K_ENTER, "Enter -> Select data", [this] { select_histogram_data(); }, on_dataset);
  m.bind(Mode::Histogram, 'b', "b -> Edit bins", [this] {
    modes_.request_input("Number of bins:", [this](const std::string& text) {
      hist_.set_bins(parse_count(text, "bin count"));
    }, std::to_string(hist_.bins()));
  });
  m.bind(Mode::Histogram, 'x', "x -> Toggle x-axis log scale", [this] { hist_.toggle_log_x(); });
  m.bind(Mode::Histogram, 'y', "y -> Toggle y-axis log scale", [this] { hist_.toggle_log_y(); });
  m.bind(Mode::Histogram, 'h', "h -> Show Histogram", [this] {
    if (!hist_.has_data()) throw InvalidUserInput("select a dataset first (Enter)");
    hist_drawn_ = true;
  });
  m.bind(Mode::Histogram, 'r', "r -> Reset", [this] {
    hist_.reset();
    hist_.set_bins(settings_.hist_bins);
    hist_drawn_ = false;
  });
}
