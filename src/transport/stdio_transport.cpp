#include "transport/stdio_transport.hpp"

#include <spdlog/spdlog.h>

namespace harness {

StdioTransport::StdioTransport(asio::io_context& io_ctx, int input_fd, int output_fd) : input_(io_ctx, input_fd), output_(io_ctx, output_fd) {}

StdioTransport::~StdioTransport() {
  close();
}

size_t StdioTransport::read_some(char* data, size_t size, asio::error_code& ec) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (!output_.is_open()) {
    ec = asio::error::bad_descriptor;
    return 0;
  }

  size_t n = output_.read_some(asio::buffer(data, size), ec);
  if (ec == asio::error::eof) {
    // End of stream is a normal outcome for the caller
    ec.clear();
    return 0;
  }
  bytes_read_ += n;
  return n;
}

size_t StdioTransport::read_some(char* data, size_t size) {
  asio::error_code ec;
  size_t n = read_some(data, size, ec);
  if (ec) {
    throw asio::system_error(ec, "stdio transport read");
  }
  return n;
}

void StdioTransport::write(std::string_view data, asio::error_code& ec) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (!input_.is_open()) {
    ec = asio::error::bad_descriptor;
    return;
  }

  size_t n = asio::write(input_, asio::buffer(data.data(), data.size()), ec);
  bytes_written_ += n;
  if (ec) {
    spdlog::debug("[StdioTransport] write failed after {} of {} bytes: {}", n, data.size(), ec.message());
  }
}

void StdioTransport::write(std::string_view data) {
  asio::error_code ec;
  write(data, ec);
  if (ec) {
    throw asio::system_error(ec, "stdio transport write");
  }
}

void StdioTransport::close_input() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  asio::error_code ec;
  input_.close(ec);
}

void StdioTransport::close() {
  close_input();

  std::lock_guard<std::mutex> lock(read_mutex_);
  asio::error_code ec;
  output_.close(ec);
}

bool StdioTransport::is_input_open() const {
  std::lock_guard<std::mutex> lock(write_mutex_);
  return input_.is_open();
}

bool StdioTransport::is_output_open() const {
  std::lock_guard<std::mutex> lock(read_mutex_);
  return output_.is_open();
}

}  // namespace harness
