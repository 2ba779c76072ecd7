#include "sandbox_options.h"

#include <cstring>
#include <algorithm>
#include <filesystem>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) : SandboxOptions() {
  size_t cur = 0;
  auto ReadInt = [&]() {
    Int r = 0;
    if (cur + sizeof(Int) > vec.size()) return r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    size_t size = std::min<size_t>(std::max<Int>(ReadInt(), 0), vec.size() - cur);
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadStrings = [&](std::vector<std::string>& v) {
    v.resize(std::min<size_t>(std::max<Int>(ReadInt(), 0), vec.size()));
    for (auto& i : v) i = ReadString();
  };
  boxdir = ReadString();
  ReadStrings(command);
  ReadStrings(envs);
  workdir = ReadString();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  vss = ReadInt();
  fsize = ReadInt();
  file_num = ReadInt();
  proc_num = ReadInt();
  ReadStrings(dirs);
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
  auto PushStrings = [&](const std::vector<std::string>& v) {
    PushInt(v.size());
    for (auto& i : v) PushString(i);
  };
  PushString(boxdir);
  PushStrings(command);
  PushStrings(envs);
  PushString(workdir);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(vss);
  PushInt(fsize);
  PushInt(file_num);
  PushInt(proc_num);
  PushStrings(dirs);
  return ret;
}

void SandboxOptions::FilterDirs() {
  std::error_code ec;
  std::vector<std::string> ret;
  for (auto& i : dirs) {
    if (std::filesystem::is_directory(i, ec) &&
        std::find(ret.begin(), ret.end(), i) == ret.end()) {
      ret.push_back(i);
    }
  }
  dirs.swap(ret);
}
