#pragma once

#include <stdexcept>
#include <string>

namespace nodeagent::util {

/*
  Central error types.

  Channel-level errors get translated to gRPC status codes; operation-level
  errors are folded into the method's Error response.
*/

// Missing or invalid configuration, certificate or key material. Fatal at startup.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transferred content does not match what the sender announced.
class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FrameTooLarge : public std::runtime_error {
 public:
  explicit FrameTooLarge(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The peer closed the stream or the transport failed mid-channel.
class ChannelClosed : public std::runtime_error {
 public:
  explicit ChannelClosed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SubprocessError : public std::runtime_error {
 public:
  explicit SubprocessError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace nodeagent::util
