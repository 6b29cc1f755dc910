#include "mode_controller.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

ModeController::ModeController(IDisplaySurface& surface) : surface_(surface) {}

void ModeController::bind(Mode mode, int key, std::string hint, Handler fn, Predicate when) {
  auto k = std::make_pair(mode, key);
  if (table_.find(k) == table_.end()) order_.push_back(k);
  table_[k] = Binding{std::move(hint), std::move(fn), std::move(when)};
}

void ModeController::enter(Mode m) {
  if (mode_ != Mode::Normal || m == Mode::Normal || m == Mode::AwaitingInput) return;
  mode_ = m;
  spdlog::debug("mode -> {}", mode_name(m));
  surface_.invalidate();
}

void ModeController::return_to_normal() {
  if (pending_) {
    pending_.reset();
    prompt_.clear();
    surface_.set_pane_text(PaneId::Prompt, "");
    surface_.focus(PaneId::Tree);
  }
  mode_ = Mode::Normal;
  surface_.invalidate();
}

bool ModeController::handle_key(int ch) {
  if (mode_ == Mode::AwaitingInput) { handle_input_key(ch); return true; }
  if (ch == K_ESC) {
    if (mode_ == Mode::Normal) return false;
    return_to_normal();
    return true;
  }
  auto it = table_.find({mode_, ch});
  if (it == table_.end()) return false;
  Binding b = it->second;
  bool handled = true;
  run_guarded([&b, &handled] {
    if (b.when && !b.when()) { handled = false; return; }
    b.fn();
  });
  return handled;
}

bool ModeController::request_input(std::string prompt, InputCallback cb, const std::string& initial) {
  if (pending_) {
    print("ERROR: another input is already pending");
    return false;
  }
  interrupted_ = mode_;
  mode_ = Mode::AwaitingInput;
  pending_ = std::move(cb);
  prompt_ = std::move(prompt);
  input_.reset(initial);
  surface_.set_pane_text(PaneId::Prompt, prompt_);
  surface_.set_pane_text(PaneId::MiniBuffer, initial);
  surface_.focus(PaneId::MiniBuffer);
  return true;
}

void ModeController::handle_input_key(int ch) {
  switch (input_.consume(ch)) {
    case Input::Result::Edited:
      surface_.set_pane_text(PaneId::MiniBuffer, input_.text());
      break;
    case Input::Result::Submit: {
      std::string text = input_.text();
      InputCallback cb = std::move(*pending_);
      pending_.reset();
      prompt_.clear();
      surface_.set_pane_text(PaneId::Prompt, "");
      surface_.set_pane_text(PaneId::MiniBuffer, "");
      surface_.focus(PaneId::Tree);
      mode_ = interrupted_;
      run_guarded([&cb, &text] { cb(text); });
    } break;
    case Input::Result::Cancel:
      return_to_normal();
      surface_.set_pane_text(PaneId::MiniBuffer, "");
      break;
    case Input::Result::Ignored:
      break;
  }
}

void ModeController::print(const std::string& msg) {
  surface_.set_pane_text(PaneId::MiniBuffer, msg);
}

void ModeController::fail(const std::string& what) {
  print("ERROR: " + what);
  return_to_normal();
  surface_.focus(PaneId::Tree);
}

void ModeController::run_guarded(const Handler& fn) {
  try {
    fn();
  } catch (const InvalidUserInput& e) {
    spdlog::info("rejected input: {}", e.what());
    fail(e.what());
  } catch (const std::exception& e) {
    spdlog::warn("handler failed: {}", e.what());
    fail(e.what());
  }
}

std::vector<std::string> ModeController::hints(Mode m) const {
  std::vector<std::string> out;
  for (const auto& k : order_) {
    if (k.first != m) continue;
    const Binding& b = table_.at(k);
    if (b.hint.empty()) continue;
    if (b.when) {
      try {
        if (!b.when()) continue;
      } catch (const std::exception& e) {
        spdlog::debug("hint '{}' hidden: {}", b.hint, e.what());
        continue;
      }
    }
    out.push_back(b.hint);
  }
  if (m != Mode::Normal && m != Mode::AwaitingInput) out.push_back("Esc -> Exit Mode");
  return out;
}
