#pragma once

#include <functional>
#include <memory>

#include "core/releasable.hpp"
#include "core/types.hpp"

namespace harness {

class StdioTransport;

// The protocol endpoint layered over a child's stdio. Message framing and
// semantics live entirely behind this interface.
class ProtocolServer : public Releasable {
 public:
  // Serve until the channel closes or abort fires
  virtual void run(const AbortSignal& abort) = 0;
};

using ProtocolServerFactory = std::function<std::unique_ptr<ProtocolServer>(std::shared_ptr<StdioTransport> transport)>;

}  // namespace harness
