#ifndef INCLUDE_JSBOX_PATHS_H_
#define INCLUDE_JSBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

fs::path ContextHelperPath();
fs::path DefaultStateDir();

// one directory per started program; a context runs at most one program at a time
fs::path ContextBoxPath(long handle, long program);
fs::path ContextBoxProgram(long handle, long program, bool inside_box = false);

#endif  // INCLUDE_JSBOX_PATHS_H_
