#ifndef JSBOX_SANDBOX_H_
#define JSBOX_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }

  friend class SandboxOptions;
};

// Everything the jsbox-context helper needs to start one program.
// Kept free of logging and other libraries; the helper links only cjail.
class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir;
  int fd_input, fd_output, fd_error; // -1 for not dup
  bool sharenet;
  int uid, gid;
  long wall_time; // us
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  std::vector<std::string> dirs;

  SandboxOptions() :
      workdir("/"),
      fd_input(-1), fd_output(-1), fd_error(-1),
      sharenet(false),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0) {}
  // false on a truncated or oversized buffer
  bool Deserialize(const std::vector<uint8_t>& serial);

  // drop directories that do not exist on this machine
  void FilterDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // ret points into this object and must not outlive it
  void ToCJailCtx(CJailCtxClass& ret) const;
};

#endif  // JSBOX_SANDBOX_H_
