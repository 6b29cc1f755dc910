#include "input.hpp"
#include "types.hpp"

Input::Result Input::consume(int ch) {
  switch (ch) {
    case K_ENTER: case '\r': return Result::Submit;
    case K_ESC: return Result::Cancel;
    case K_BACKSPACE: case 8:
      if (cursor_ > 0) { text_.erase(static_cast<size_t>(cursor_ - 1), 1); cursor_--; }
      return Result::Edited;
    case K_LEFT: if (cursor_ > 0) cursor_--; return Result::Edited;
    case K_RIGHT: if (cursor_ < (int)text_.size()) cursor_++; return Result::Edited;
    case K_HOME: cursor_ = 0; return Result::Edited;
    case K_END: cursor_ = (int)text_.size(); return Result::Edited;
    default: break;
  }
  if (ch >= 32 && ch < 127) {
    text_.insert(text_.begin() + cursor_, static_cast<char>(ch));
    cursor_++;
    return Result::Edited;
  }
  return Result::Ignored;
}

void Input::reset(const std::string& initial) {
  text_ = initial;
  cursor_ = (int)text_.size();
}
