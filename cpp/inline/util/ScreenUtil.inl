#include "util/ScreenUtil.hpp"

#include "util/Exception.hpp"

#include <sys/ioctl.h>

#include <cstdlib>
#include <unistd.h>

namespace util {

inline int get_screen_width() {
  static const int width = [] {
    winsize ws{};
    bool ok = ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0;
    return ok ? static_cast<int>(ws.ws_col) : 80;
  }();
  return width;
}

inline void clearscreen() {
  int rc = std::system("clear");
  if (rc != 0) {
    throw util::Exception("clearscreen(): system(\"clear\") exited with status {}", rc);
  }
}

}  // namespace util
