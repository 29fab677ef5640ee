#pragma once
#include <cstddef>
#include <string>
/*
 * Input
 *
 * Purpose: pending-key state for the editor: Normal mode operator
 * sequences (dd, yy, r<char>, d/c + i/a + w), the gg prefix, count
 * prefixes, and UTF-8 byte accumulation (getch delivers a multi-byte
 * character one byte at a time).
 */

class Input {
public:
  bool consumeGg(int ch);
  bool consumeDigit(int ch);
  bool hasCount() const;
  size_t takeCount();

  // Operator keys typed so far, e.g. "d", "ci". Empty when none is pending.
  void beginOperator(char op);
  void pushOperatorKey(char key);
  const std::string& operatorKeys() const { return ops_; }

  bool pending() const;
  void reset();

  // Returns true once `out` holds a complete character. Stray bytes are dropped.
  bool pushByte(int ch, std::string& out);

private:
  bool pending_g_ = false;
  size_t pending_count_ = 0;
  std::string ops_;
  std::string utf8_;
  int utf8_expected_ = 0;
};
