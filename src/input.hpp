#pragma once
#include <string>
/*
 * Input
 *
 * Purpose: single-line editor behind the mini buffer while a prompt is pending.
 * Keys: printable insert, Backspace, Left/Right, Home/End; Enter submits, Esc cancels.
 */

class Input {
public:
  enum class Result { Edited, Submit, Cancel, Ignored };
  Result consume(int ch);
  void reset(const std::string& initial = std::string());
  const std::string& text() const { return text_; }
  int cursor() const { return cursor_; }
private:
  std::string text_;
  int cursor_ = 0;
};
