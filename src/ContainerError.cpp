#include "blobpack/ContainerError.hpp"

namespace blobpack
{

const char * ErrorCodeName(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::SourceNotFound:
    return "SourceNotFound";
  case ErrorCode::SourceUnreadable:
    return "SourceUnreadable";
  case ErrorCode::DestinationWriteError:
    return "DestinationWriteError";
  case ErrorCode::InvalidContainer:
    return "InvalidContainer";
  }
  return "Unknown";
}

}
