#include "input.hpp"
#include "utf8.hpp"

bool Input::consumeGg(int ch) {
  if (ch == 'g') {
    if (pending_g_) { pending_g_ = false; return true; }
    pending_g_ = true; return false;
  }
  return false;
}

bool Input::consumeDigit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    if (pending_count_ > 100000) pending_count_ = 100000;
    return true;
  }
  if (ch == '0') {
    if (pending_count_ > 0) {
      pending_count_ = pending_count_ * 10;
      if (pending_count_ > 100000) pending_count_ = 100000;
      return true;
    }
  }
  return false;
}

bool Input::hasCount() const {
  return pending_count_ > 0;
}

size_t Input::takeCount() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::beginOperator(char op) {
  pending_g_ = false;
  ops_.assign(1, op);
  utf8_.clear();
  utf8_expected_ = 0;
}

void Input::pushOperatorKey(char key) {
  if (!ops_.empty()) ops_.push_back(key);
}

bool Input::pending() const {
  return pending_g_ || pending_count_ > 0 || !ops_.empty();
}

void Input::reset() {
  pending_g_ = false;
  pending_count_ = 0;
  ops_.clear();
  utf8_.clear();
  utf8_expected_ = 0;
}

bool Input::pushByte(int ch, std::string& out) {
  if (ch < 0 || ch > 0xFF) { utf8_.clear(); utf8_expected_ = 0; return false; }
  unsigned char b = static_cast<unsigned char>(ch);
  if (utf8_expected_ == 0) {
    int n = utf8_sequence_length(b);
    if (n == 0) return false;
    if (n == 1) { out.assign(1, static_cast<char>(b)); return true; }
    utf8_.assign(1, static_cast<char>(b));
    utf8_expected_ = n;
    return false;
  }
  if ((b & 0xC0) != 0x80) {
    utf8_.clear();
    utf8_expected_ = 0;
    return pushByte(ch, out);
  }
  utf8_.push_back(static_cast<char>(b));
  if (static_cast<int>(utf8_.size()) == utf8_expected_) {
    out = utf8_;
    utf8_.clear();
    utf8_expected_ = 0;
    return true;
  }
  return false;
}
