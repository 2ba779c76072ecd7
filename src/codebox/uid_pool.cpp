#include "uid_pool.h"

#include <mutex>
#include <vector>
#include <condition_variable>

#include <spdlog/spdlog.h>

namespace {

constexpr int kUidBase = 50000, kUidPoolSize = 100;

std::mutex pool_mtx;
std::condition_variable pool_cv;
std::vector<int> uid_pool;
bool pool_init = false;

} // namespace

UidLease::UidLease() {
  std::unique_lock<std::mutex> lck(pool_mtx);
  if (!pool_init) {
    for (int i = kUidPoolSize - 1; i >= 0; i--) uid_pool.push_back(i + kUidBase);
    pool_init = true;
  }
  if (uid_pool.empty()) spdlog::info("No free sandbox uid; waiting");
  pool_cv.wait(lck, []{ return !uid_pool.empty(); });
  uid_ = uid_pool.back();
  uid_pool.pop_back();
}

UidLease::~UidLease() {
  {
    std::lock_guard<std::mutex> lck(pool_mtx);
    uid_pool.push_back(uid_);
  }
  pool_cv.notify_one();
}
