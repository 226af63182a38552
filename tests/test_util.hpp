#pragma once

#include <gtest/gtest.h>
#include <signal.h>

#include <cerrno>
#include <chrono>
#include <fstream>
#include <functional>
#include <iterator>
#include <string>
#include <thread>

#include "core/error.hpp"
#include "transport/stdio_transport.hpp"

namespace harness::test {

// Kind of the HarnessError thrown by fn; fails the test if nothing is thrown
inline ErrorKind error_kind_of(const std::function<void()>& fn) {
  try {
    fn();
  } catch (const HarnessError& e) {
    return e.kind();
  }
  ADD_FAILURE() << "expected HarnessError";
  return ErrorKind::DisposalError;
}

// Read until end of stream
inline std::string read_all(StdioTransport& transport) {
  std::string out;
  char buf[1024];
  size_t n;
  while ((n = transport.read_some(buf, sizeof(buf))) > 0) {
    out.append(buf, n);
  }
  return out;
}

// Read until the first newline (excluded) or end of stream
inline std::string read_line(StdioTransport& transport) {
  std::string out;
  char c;
  while (transport.read_some(&c, 1) == 1 && c != '\n') {
    out.push_back(c);
  }
  return out;
}

// True once the pid no longer names any process, zombies included
inline bool process_gone(pid_t pid) {
  return ::kill(pid, 0) == -1 && errno == ESRCH;
}

// Gone, or a zombie waiting for a reaper it does not control (an orphan
// under a container init that never calls wait)
inline bool process_dead(pid_t pid) {
  if (process_gone(pid)) return true;
  std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
  std::string content((std::istreambuf_iterator<char>(stat)), std::istreambuf_iterator<char>());
  auto paren = content.rfind(')');
  if (paren == std::string::npos || paren + 2 >= content.size()) return process_gone(pid);
  return content[paren + 2] == 'Z' || content[paren + 2] == 'X';
}

inline bool eventually(const std::function<bool()>& cond, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (cond()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return cond();
}

}  // namespace harness::test
