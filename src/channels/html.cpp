#include "julesbot/channels/html.hpp"

namespace julesbot::channels::html {

std::string escape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    switch (ch) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  return out;
}

std::string bold(const std::string &text) { return "<b>" + escape(text) + "</b>"; }

std::string code(const std::string &text) { return "<code>" + escape(text) + "</code>"; }

} // namespace julesbot::channels::html
