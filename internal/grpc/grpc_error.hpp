#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace nodeagent::grpc {

/*
  Converts channel-level exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace nodeagent::grpc
