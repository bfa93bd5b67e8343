#ifndef _BLOBPACK_API_CONTAINER_ERROR_H
#define _BLOBPACK_API_CONTAINER_ERROR_H

#include <stdexcept>
#include <string>
#include "blobpack/Defs.hpp"

namespace blobpack
{

enum class ErrorCode
{
  InvalidArgument,
  SourceNotFound,
  SourceUnreadable,
  DestinationWriteError,
  InvalidContainer
};

BLOBPACK_API_DECL const char * ErrorCodeName(ErrorCode code);

// The only exception type thrown by merge and split
class BLOBPACK_API_DECL ContainerError: public std::runtime_error
{
public:
  ContainerError(ErrorCode code, std::string const & msg)
    : runtime_error(msg)
    , m_code(code)
  {}

  ErrorCode code() const { return m_code; }
  const char * message() const { return what(); }

private:
  ErrorCode m_code;
};

}

#endif
