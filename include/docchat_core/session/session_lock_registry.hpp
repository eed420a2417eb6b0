#pragma once

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace docchat_core {

/*
One reader/writer lock per session id. Index writers take it exclusively,
index readers take it shared; different sessions never contend. Sessions do
not expire, so a lock normally lives as long as the registry; release() drops
the entry for a session that was never created.
*/
class SessionLockRegistry {
 public:
  std::shared_ptr<std::shared_mutex> lock_for(const std::string &session_id) {
    std::lock_guard<std::mutex> guard(mtx_);
    auto &slot = locks_[session_id];
    if (!slot) {
      slot = std::make_shared<std::shared_mutex>();
    }
    return slot;
  }

  // Drops the lock unless someone still holds it. Returns true if it was dropped.
  bool release(const std::string &session_id) {
    std::lock_guard<std::mutex> guard(mtx_);
    auto it = locks_.find(session_id);
    if (it == locks_.end() || it->second.use_count() > 1) {
      return false;
    }
    locks_.erase(it);
    return true;
  }

  size_t size() {
    std::lock_guard<std::mutex> guard(mtx_);
    return locks_.size();
  }

 private:
  std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> locks_;
};

}  // namespace docchat_core
