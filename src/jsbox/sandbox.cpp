#include "sandbox.h"

#include <unistd.h>
#include <cstring>
#include <filesystem>

bool SandboxOptions::Deserialize(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  bool ok = true;
  auto ReadInt = [&]() -> Int {
    if (!ok || cur + sizeof(Int) > vec.size()) {
      ok = false;
      return 0;
    }
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (!ok || size < 0 || cur + size > vec.size()) {
      ok = false;
      return std::string();
    }
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadCount = [&]() -> size_t {
    Int size = ReadInt();
    // every element takes at least one Int
    if (!ok || size < 0 || (size_t)size > vec.size() / sizeof(Int)) {
      ok = false;
      return 0;
    }
    return size;
  };
  boxdir = ReadString();
  command.resize(ReadCount());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadCount());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  fd_input = ReadInt();
  fd_output = ReadInt();
  fd_error = ReadInt();
  sharenet = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  dirs.resize(ReadCount());
  for (auto& i : dirs) i = ReadString();
  return ok && cur == vec.size() && !command.empty();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str) {
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushInt(fd_input);
  PushInt(fd_output);
  PushInt(fd_error);
  PushInt(sharenet);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(dirs.size());
  for (auto& i : dirs) PushString(i);
  return ret;
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> kept;
  for (auto& i : dirs) {
    std::error_code ec;
    if (std::filesystem::is_directory(i, ec)) kept.push_back(i);
  }
  dirs.swap(kept);
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd
  ctx.sharenet = sharenet;
  if (fd_input != -1) ctx.fd_input = fd_input;
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = const_cast<char*>(boxdir.data());
  ctx.working_dir = const_cast<char*>(workdir.data());
  // default: cgroup_root
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_proc = proc_num;
  // default: rlim_fsize, rlim_stack (no limit)
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  // no cpu time limit; the wall limit bounds everything
  // default: seccomp_cfg
  // bind mounts; pointers into both buffers are handed to cjail, so no reallocation after this
  ret.str_buf_.reserve(dirs.size());
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    mnt_ctx.source = mnt_ctx.target = const_cast<char*>(i.data());
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
