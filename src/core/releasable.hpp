#pragma once

namespace harness {

// Anything that holds an external resource and can give it back.
// release() must be idempotent. It may throw; callers on cleanup paths catch.
class Releasable {
 public:
  virtual ~Releasable() = default;

  virtual void release() = 0;
};

}  // namespace harness
