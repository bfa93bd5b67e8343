#pragma once

#include <string>
#include "blobpack/ContainerError.hpp"

namespace blobpack
{

[[noreturn]]
inline void ThrowContainerError(ErrorCode code, std::string const & description)
{
  throw ContainerError(code, description);
}

}

#define BLOBPACK_STRINGIFY_IMPL(s) #s
#define BLOBPACK_STRINGIFY(s) BLOBPACK_STRINGIFY_IMPL(s)

#define BLOBPACK_FORMAT_ASSERT(expression) \
  (void)((!!(expression)) || (::blobpack::ThrowContainerError(::blobpack::ErrorCode::InvalidContainer, \
    "Invalid container format at " __FILE__ " (" BLOBPACK_STRINGIFY(__LINE__) ")"), false))
