#include "ui/Formatting.hpp"

namespace procsnap::ui {

int u8_len(unsigned char c){
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

int display_cols(const std::string& s){
  int cols = 0;
  for (size_t i=0; i<s.size();){
    i += u8_len((unsigned char)s[i]);
    cols += 1;
  }
  return cols;
}

std::string pad_right(const std::string& s, int w) {
  int cols = display_cols(s);
  if (cols >= w) return s;
  return s + std::string(w - cols, ' ');
}

std::string printable(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    unsigned char u = static_cast<unsigned char>(c);
    out.push_back((u < 0x20 || u == 0x7F) ? ' ' : c);
  }
  while (!out.empty() && out.back() == ' ') out.pop_back();
  return out;
}

} // namespace procsnap::ui
