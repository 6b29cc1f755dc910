#pragma once
/*
 * ModeController
 *
 * Purpose: modal key dispatch. A static (mode, key) table filled once at start-up;
 * the current Mode enum picks the active set, so exactly one mode is live.
 * Input: request_input() parks a one-shot continuation and switches to
 * AwaitingInput; Enter hands the typed text over and returns to the
 * interrupted mode, Esc cancels to Normal.
 * Errors: every predicate, handler and continuation runs behind run_guarded(), which turns
 * std::exception into an "ERROR: ..." message and falls back to Normal.
 * QuitRequested is not caught. A predicate that throws while hints are listed
 * hides its hint.
 */
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"
#include "input.hpp"
#include "i_display_surface.hpp"

class ModeController {
public:
  using Handler = std::function<void()>;
  using Predicate = std::function<bool()>;
  using InputCallback = std::function<void(const std::string&)>;

  struct Binding {
    std::string hint;
    Handler fn;
    Predicate when;
  };

  explicit ModeController(IDisplaySurface& surface);

  Mode mode() const { return mode_; }
  bool is_active(Mode m) const { return mode_ == m; }

  void bind(Mode mode, int key, std::string hint, Handler fn, Predicate when = nullptr);
  // leader transition, only honoured from Normal
  void enter(Mode m);
  void return_to_normal();
  bool handle_key(int ch);

  // refused (false) while another request is pending
  bool request_input(std::string prompt, InputCallback cb, const std::string& initial = std::string());
  bool awaiting_input() const { return pending_.has_value(); }
  const std::string& prompt() const { return prompt_; }
  const Input& input() const { return input_; }

  void print(const std::string& msg);
  void run_guarded(const Handler& fn);
  std::vector<std::string> hints(Mode m) const;

private:
  void handle_input_key(int ch);
  void fail(const std::string& what);

  IDisplaySurface& surface_;
  Mode mode_ = Mode::Normal;
  Mode interrupted_ = Mode::Normal;
  std::map<std::pair<Mode, int>, Binding> table_;
  std::vector<std::pair<Mode, int>> order_;
  std::optional<InputCallback> pending_;
  std::string prompt_;
  Input input_;
};
