#pragma once

#include <asio.hpp>
#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

namespace harness {

// Duplex byte channel over a child's stdin (write side) and stdout (read side).
// Bytes are passed through untouched; framing belongs to the protocol layer.
//
// One reader thread and one writer thread may use the transport concurrently.
class StdioTransport {
 public:
  // Takes ownership of both descriptors
  StdioTransport(asio::io_context& io_ctx, int input_fd, int output_fd);

  ~StdioTransport();

  StdioTransport(const StdioTransport&) = delete;
  StdioTransport& operator=(const StdioTransport&) = delete;

  // Read whatever is available from the child's stdout, blocking until at least one byte.
  // Returns 0 at end of stream.
  size_t read_some(char* data, size_t size, asio::error_code& ec);

  size_t read_some(char* data, size_t size);

  // Write the whole buffer to the child's stdin
  void write(std::string_view data, asio::error_code& ec);

  void write(std::string_view data);

  // Close the child's stdin so it observes end of input
  void close_input();

  // Close both directions. Must not race with a blocked read_some().
  void close();

  bool is_input_open() const;

  bool is_output_open() const;

  size_t bytes_read() const {
    return bytes_read_.load();
  }

  size_t bytes_written() const {
    return bytes_written_.load();
  }

 private:
  asio::posix::stream_descriptor input_;   // child's stdin
  asio::posix::stream_descriptor output_;  // child's stdout

  mutable std::mutex write_mutex_;
  mutable std::mutex read_mutex_;

  std::atomic<size_t> bytes_read_{0};
  std::atomic<size_t> bytes_written_{0};
};

}  // namespace harness
