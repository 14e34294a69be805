#pragma once

#include <exception>

#include <grpcpp/grpcpp.h>

namespace alo::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    NotFound, UnknownDimension -> NOT_FOUND
    InvalidArgument            -> INVALID_ARGUMENT
    InvalidState               -> FAILED_PRECONDITION
    AlreadyExists              -> ALREADY_EXISTS
    Conflict                   -> ABORTED
    anything else              -> INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

// Runs a service call, mapping exceptions through ToStatus.
template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace alo::grpc
