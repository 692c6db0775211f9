#include "rio/http/text_util.h"

namespace rio::http {

bool is_space(char c) {
  return c == ' ' || c == '\t';
}

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

char to_lower(char c) {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<char>(c - 'A' + 'a');
  }
  return c;
}

kj::String trim(kj::StringPtr s) {
  size_t begin = 0;
  size_t end = s.size();
  while (begin < end && is_space(s[begin])) {
    ++begin;
  }
  while (end > begin && is_space(s[end - 1])) {
    --end;
  }
  return kj::heapString(s.begin() + begin, end - begin);
}

kj::String lowercase(kj::StringPtr s) {
  kj::String out = kj::heapString(s);
  for (char& c : out) {
    c = to_lower(c);
  }
  return out;
}

kj::String uppercase(kj::StringPtr s) {
  kj::String out = kj::heapString(s);
  for (char& c : out) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return out;
}

bool equals_ignore_case(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (to_lower(a[i]) != to_lower(b[i])) {
      return false;
    }
  }
  return true;
}

kj::Vector<kj::String> split(kj::StringPtr text, char separator) {
  kj::Vector<kj::String> pieces;
  size_t start = 0;
  for (size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == separator) {
      pieces.add(kj::heapString(text.begin() + start, i - start));
      start = i + 1;
    }
  }
  return pieces;
}

kj::Vector<kj::String> split_list(kj::StringPtr text) {
  kj::Vector<kj::String> items;
  for (auto& piece : split(text, ',')) {
    auto item = trim(piece);
    if (item.size() > 0) {
      items.add(kj::mv(item));
    }
  }
  return items;
}

} // namespace rio::http
