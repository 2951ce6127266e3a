#include "ui/Input.hpp"
#include <unistd.h>
#include <poll.h>

namespace hostscope::ui {

bool has_input_available(int timeout_ms) {
  struct pollfd pfd{.fd=STDIN_FILENO,.events=POLLIN,.revents=0};
  int to = timeout_ms;
  if (to < 10) to = 10;
  if (to > 1000) to = 1000;
  int rv = ::poll(&pfd, 1, to);
  return rv > 0 && (pfd.revents & POLLIN);
}

std::vector<Config::Action> decode_keys(std::string_view bytes, const Config& cfg) {
  std::vector<Config::Action> out;
  size_t k = 0;
  while (k < bytes.size()) {
    unsigned char c = static_cast<unsigned char>(bytes[k++]);
    if (c == 0x1B) {
      // ESC [ ... final byte in '@'..'~'
      if (k < bytes.size() && bytes[k] == '[') {
        ++k;
        while (k < bytes.size() && (bytes[k] < '@' || bytes[k] > '~')) ++k;
        if (k < bytes.size()) ++k;
      }
      continue;
    }
    auto it = cfg.keybinds.find(static_cast<char>(c));
    if (it != cfg.keybinds.end()) out.push_back(it->second);
  }
  return out;
}

std::vector<Config::Action> handle_keyboard_input(const Config& cfg) {
  char buf[32];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n <= 0) return {};
  return decode_keys(std::string_view(buf, static_cast<size_t>(n)), cfg);
}

} // namespace hostscope::ui
