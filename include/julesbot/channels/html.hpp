#pragma once

#include <string>

namespace julesbot::channels::html {

/// Escape &, < and > for Telegram's HTML parse mode.
[[nodiscard]] std::string escape(const std::string &text);
[[nodiscard]] std::string bold(const std::string &text);
[[nodiscard]] std::string code(const std::string &text);

} // namespace julesbot::channels::html
