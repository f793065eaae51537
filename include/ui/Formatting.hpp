#pragma once

#include <string>

namespace procsnap::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);

// Left-align s in a field of w columns. Longer text is kept whole.
std::string pad_right(const std::string& s, int w);

// Replace control bytes (argv NUL separators, newlines) with spaces and drop
// trailing whitespace.
std::string printable(const std::string& s);

} // namespace procsnap::ui
