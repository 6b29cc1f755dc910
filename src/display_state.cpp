#include "display_state.hpp"

void DisplayState::set_pane_text(PaneId pane, std::string text) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    texts_[static_cast<size_t>(pane)] = std::move(text);
  }
  invalidate();
}

std::string DisplayState::pane_text(PaneId pane) const {
  std::lock_guard<std::mutex> lk(mu_);
  return texts_[static_cast<size_t>(pane)];
}

void DisplayState::set_pane_title(PaneId pane, std::string title) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    titles_[static_cast<size_t>(pane)] = std::move(title);
  }
  invalidate();
}

std::string DisplayState::pane_title(PaneId pane) const {
  std::lock_guard<std::mutex> lk(mu_);
  return titles_[static_cast<size_t>(pane)];
}
