#include "mode_controller.hpp"
#include "display_state.hpp"
#include "range_parser.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <cassert>
#include <optional>
#include <string>

static void type(ModeController& m, const std::string& s) {
  for (char c : s) m.handle_key(static_cast<unsigned char>(c));
}

static void test_leaders_and_escape() {
  DisplayState d;
  ModeController m(d);
  int jumps = 0;
  m.bind(Mode::Normal, 'g', "g -> Goto Mode", [&] { m.enter(Mode::Jump); });
  m.bind(Mode::Normal, 'd', "d -> Dataset Mode", [&] { m.enter(Mode::Dataset); });
  m.bind(Mode::Jump, 't', "t -> Top", [&] { jumps++; m.return_to_normal(); });
  assert(m.mode() == Mode::Normal);
  assert(!m.handle_key('t'));
  assert(jumps == 0);
  assert(m.handle_key('g'));
  assert(m.is_active(Mode::Jump));
  assert(!m.is_active(Mode::Normal));
  // a leader from another mode does not stack modes
  assert(!m.handle_key('d'));
  assert(m.is_active(Mode::Jump));
  assert(m.handle_key(K_ESC));
  assert(m.mode() == Mode::Normal);
  assert(!m.handle_key(K_ESC));
  m.handle_key('g');
  m.handle_key('t');
  assert(jumps == 1);
  assert(m.mode() == Mode::Normal);
}

static void test_predicates_and_hints() {
  DisplayState d;
  ModeController m(d);
  bool open = false;
  int hits = 0;
  m.bind(Mode::Normal, 'x', "x -> Thing", [&] { hits++; }, [&] { return open; });
  m.bind(Mode::Normal, 'y', "", [&] { hits++; });
  m.bind(Mode::Normal, 'z', "z -> Other", [&] { hits++; });
  assert(!m.handle_key('x'));
  assert(m.hints(Mode::Normal) == std::vector<std::string>{"z -> Other"});
  open = true;
  assert(m.handle_key('x'));
  assert((m.hints(Mode::Normal) == std::vector<std::string>{"x -> Thing", "z -> Other"}));
  assert(hits == 1);
  m.bind(Mode::Plot, 'r', "r -> Reset", [] {});
  assert((m.hints(Mode::Plot) == std::vector<std::string>{"r -> Reset", "Esc -> Exit Mode"}));
}

static void test_range_prompt_scenario() {
  DisplayState d;
  ModeController m(d);
  std::optional<IndexRange> got;
  m.bind(Mode::Normal, 'd', "", [&] { m.enter(Mode::Dataset); });
  m.bind(Mode::Dataset, 'V', "", [&] {
    m.request_input("Enter the index range (start-end):", [&](const std::string& text) {
      got = parse_range(text);
      m.return_to_normal();
    });
  });
  type(m, "dV");
  assert(m.mode() == Mode::AwaitingInput);
  assert(d.focused() == PaneId::MiniBuffer);
  assert(d.pane_text(PaneId::Prompt) == "Enter the index range (start-end):");
  type(m, "2-5");
  assert(m.input().text() == "2-5");
  assert(d.pane_text(PaneId::MiniBuffer) == "2-5");
  m.handle_key(K_ENTER);
  assert(got && got->start == 2 && got->end == 5);
  assert(m.mode() == Mode::Normal);
  assert(d.focused() == PaneId::Tree);
  assert(d.pane_text(PaneId::Prompt).empty());

  got.reset();
  type(m, "dV");
  type(m, "abc");
  m.handle_key(K_ENTER);
  assert(!got);
  assert(m.mode() == Mode::Normal);
  assert(d.focused() == PaneId::Tree);
  assert(d.pane_text(PaneId::MiniBuffer).rfind("ERROR: ", 0) == 0);
}

static void test_one_shot_capture() {
  DisplayState d;
  ModeController m(d);
  int fired = 0;
  std::string seen;
  m.bind(Mode::Histogram, 'b', "", [&] {
    m.request_input("Number of bins:", [&](const std::string& text) { fired++; seen = text; }, "50");
  });
  m.bind(Mode::Normal, 'H', "", [&] { m.enter(Mode::Histogram); });
  type(m, "Hb");
  assert(m.input().text() == "50");
  m.handle_key(K_BACKSPACE);
  m.handle_key(K_BACKSPACE);
  type(m, "80");
  m.handle_key(K_LEFT);
  m.handle_key(K_HOME);
  m.handle_key('1');
  m.handle_key(K_END);
  m.handle_key(K_ENTER);
  assert(fired == 1);
  assert(seen == "180");
  // back in the interrupted mode
  assert(m.mode() == Mode::Histogram);
  m.handle_key(K_ENTER);
  assert(fired == 1);

  // a second request while one is pending is refused, the first still fires once
  int first = 0, second = 0;
  assert(m.request_input("first", [&](const std::string&) { first++; }));
  assert(!m.request_input("second", [&](const std::string&) { second++; }));
  assert(m.prompt() == "first");
  m.handle_key(K_ENTER);
  assert(first == 1 && second == 0);
}

static void test_cancel() {
  DisplayState d;
  ModeController m(d);
  int fired = 0;
  m.bind(Mode::Normal, 'g', "", [&] { m.enter(Mode::Jump); });
  m.bind(Mode::Jump, 'K', "", [&] { m.request_input("Jump to:", [&](const std::string&) { fired++; }); });
  type(m, "gKabc");
  m.handle_key(K_ESC);
  assert(fired == 0);
  assert(m.mode() == Mode::Normal);
  assert(!m.awaiting_input());
  assert(d.focused() == PaneId::Tree);
  assert(d.pane_text(PaneId::Prompt).empty());
}

static void test_error_boundary() {
  DisplayState d;
  ModeController m(d);
  m.bind(Mode::Normal, 'p', "", [&] { m.enter(Mode::Plot); });
  m.bind(Mode::Plot, 'e', "", [] { throw ReadError("disk on fire"); });
  m.bind(Mode::Plot, 'i', "", [] { throw IndexOutOfRange("row 9"); });
  m.bind(Mode::Normal, 'q', "", [] { throw QuitRequested{}; });
  d.focus(PaneId::Values);
  type(m, "pe");
  assert(d.pane_text(PaneId::MiniBuffer) == "ERROR: disk on fire");
  assert(m.mode() == Mode::Normal);
  assert(d.focused() == PaneId::Tree);
  type(m, "pi");
  assert(d.pane_text(PaneId::MiniBuffer) == "ERROR: row 9");
  assert(m.mode() == Mode::Normal);
  assert(throws_as<QuitRequested>([&] { m.handle_key('q'); }));

  // a failing predicate is reported like a failing handler
  int hits = 0;
  bool broken = true;
  m.bind(Mode::Normal, 'v', "v -> Values", [&] { hits++; }, [&]() -> bool {
    if (broken) throw IndexOutOfRange("row 12");
    return true;
  });
  assert((m.hints(Mode::Normal) == std::vector<std::string>{}));
  assert(m.handle_key('v'));
  assert(hits == 0);
  assert(d.pane_text(PaneId::MiniBuffer) == "ERROR: row 12");
  assert(m.mode() == Mode::Normal);
  broken = false;
  assert(m.handle_key('v'));
  assert(hits == 1);
  assert((m.hints(Mode::Normal) == std::vector<std::string>{"v -> Values"}));
}

int main() {
  test_leaders_and_escape();
  test_predicates_and_hints();
  test_range_prompt_scenario();
  test_one_shot_capture();
  test_cancel();
  test_error_boundary();
  return 0;
}
