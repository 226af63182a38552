#pragma once

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace harness {

// UUID v4 and short id generator
class UUID {
 public:
  static std::string generate() {
    uint64_t ab = 0;
    uint64_t cd = 0;
    {
      std::lock_guard<std::mutex> lock(mutex());
      ab = engine()();
      cd = engine()();
    }

    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

 private:
  static std::mt19937_64& engine() {
    static std::mt19937_64 gen{std::random_device{}()};
    return gen;
  }

  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }
};

}  // namespace harness
