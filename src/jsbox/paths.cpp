#include <jsbox/paths.h>

#include <cstdlib>

fs::path kBoxRoot = "/tmp/jsbox_box";

namespace internal {
fs::path kDataDir = fs::path(JSBOX_DATA_DIR);
} // internal

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(fs::path root, bool inside_box) {
  return inside_box ? fs::path("/") : root;
}

} // namespace

fs::path ContextHelperPath() {
  return internal::kDataDir / "jsbox-context";
}

fs::path DefaultStateDir() {
  if (const char* xdg = getenv("XDG_DATA_HOME"); xdg && *xdg) return fs::path(xdg) / "jsbox";
  if (const char* home = getenv("HOME"); home && *home) {
    return fs::path(home) / ".local" / "share" / "jsbox";
  }
  return "/var/lib/jsbox";
}

fs::path ContextBoxPath(long handle, long program) {
  return kBoxRoot / (PadInt(handle, 6) + "_" + PadInt(program, 6));
}

fs::path ContextBoxProgram(long handle, long program, bool inside_box) {
  return BoxRoot(ContextBoxPath(handle, program), inside_box) / "bootstrap.js";
}
