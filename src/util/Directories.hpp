#pragma once

#include <boost/filesystem.hpp>
#include "Assert.hpp"

namespace blobpack { namespace util {

// Creates path with all missing parents. An existing directory is not an error.
inline void CreateDirectories(boost::filesystem::path const & path)
{
  boost::system::error_code ec;
  boost::filesystem::create_directories(path, ec);
  if (ec)
    ThrowContainerError(ErrorCode::DestinationWriteError,
      "Can't create directory " + path.string() + ": " + ec.message());
  if (!boost::filesystem::is_directory(path, ec))
    ThrowContainerError(ErrorCode::DestinationWriteError,
      "Path exists and is not a directory: " + path.string());
}

}}
