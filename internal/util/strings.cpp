#include "strings.hpp"

#include <cctype>

namespace heartbeat::util {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && IsSpace(value[begin])) ++begin;
  while (end > begin && IsSpace(value[end - 1])) --end;
  return std::string(value.substr(begin, end - begin));
}

bool IsBlank(std::string_view value) {
  for (char c : value) {
    if (!IsSpace(c)) return false;
  }
  return true;
}

std::string ToLower(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool IsHttpUrl(std::string_view value) {
  const auto lower = ToLower(value);
  for (std::string_view scheme : {"http://", "https://"}) {
    if (lower.size() > scheme.size() && lower.compare(0, scheme.size(), scheme) == 0) return true;
  }
  return false;
}

} // namespace heartbeat::util
