#pragma once

#include <dlfcn.h>
#include <unistd.h>

#include <array>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace batchpress::test {

// Resolve the next definition of a libc symbol, so that tests can interpose system calls
// (define an extern "C" function with the same name) and still forward to the real one.
// Aborts if symbol resolution fails: the test binary cannot run meaningfully without it.
template <typename Fn>
Fn ResolveNext(const char* name) {
  void* sym = ::dlsym(RTLD_NEXT, name);
  if (sym == nullptr) {
    std::abort();
  }
  return reinterpret_cast<Fn>(sym);
}

// Path of the file currently opened as 'fd', read from /proc/self/fd.
inline std::optional<std::string> PathForFd(int fd) {
  std::array<char, 64> linkBuf{};
  std::snprintf(linkBuf.data(), linkBuf.size(), "/proc/self/fd/%d", fd);
  std::array<char, 512> pathBuf{};
  const auto len = ::readlink(linkBuf.data(), pathBuf.data(), pathBuf.size() - 1);
  if (len <= 0) {
    return std::nullopt;
  }
  pathBuf[static_cast<std::size_t>(len)] = '\0';
  return std::string(pathBuf.data());
}

// Errno values to inject into successive interposed system calls, per key (fd, path...).
template <typename Key>
class ScriptedErrnos {
 public:
  ScriptedErrnos() = default;
  ScriptedErrnos(const ScriptedErrnos&) = delete;
  ScriptedErrnos& operator=(const ScriptedErrnos&) = delete;

  void script(const Key& key, std::initializer_list<int> errnos) {
    std::scoped_lock<std::mutex> lock(_mutex);
    if (errnos.size() == 0) {
      _pending.erase(key);
    } else {
      _pending.insert_or_assign(key, std::deque<int>(errnos));
    }
  }

  void clear() {
    std::scoped_lock<std::mutex> lock(_mutex);
    _pending.clear();
  }

  [[nodiscard]] bool empty() {
    std::scoped_lock<std::mutex> lock(_mutex);
    return _pending.empty();
  }

  // Next scripted errno for 'key', if any.
  [[nodiscard]] std::optional<int> next(const Key& key) {
    std::scoped_lock<std::mutex> lock(_mutex);
    auto it = _pending.find(key);
    if (it == _pending.end()) {
      return std::nullopt;
    }
    const int err = it->second.front();
    it->second.pop_front();
    if (it->second.empty()) {
      _pending.erase(it);
    }
    return err;
  }

 private:
  std::mutex _mutex;
  std::unordered_map<Key, std::deque<int>> _pending;
};

// Clears the scripted errnos on scope exit.
template <typename Key>
class ScriptedErrnosGuard {
 public:
  explicit ScriptedErrnosGuard(ScriptedErrnos<Key>& errnos) noexcept : _errnos(errnos) {}
  ScriptedErrnosGuard(const ScriptedErrnosGuard&) = delete;
  ScriptedErrnosGuard& operator=(const ScriptedErrnosGuard&) = delete;
  ~ScriptedErrnosGuard() { _errnos.clear(); }

 private:
  ScriptedErrnos<Key>& _errnos;
};

}  // namespace batchpress::test
