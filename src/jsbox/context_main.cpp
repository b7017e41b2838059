// jsbox-context: runs one program under cjail.
//   fd 0: serialized SandboxOptions (length-prefixed), then EOF
//   fd 1: receives the struct cjail_result when the program ends
// Every other descriptor the options refer to is inherited from the host.

#include <errno.h>
#include <unistd.h>

#include "sandbox.h"

namespace {

constexpr long kMaxOptionsSize = 1 << 20;

bool ReadAll(int fd, void* buf, size_t len) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (len) {
    ssize_t r = read(fd, ptr, len);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) return false;
    ptr += r;
    len -= r;
  }
  return true;
}

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0 || sz > kMaxOptionsSize) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  SandboxOptions opt;
  if (!opt.Deserialize(buf)) return 1;
  struct cjail_result res = SandboxExec(opt);
  if (write(1, &res, sizeof(res)) != (ssize_t)sizeof(res)) return 1;
}
