#pragma once

#include <algorithm>
#include <vector>
#include "blobpack/IStorage.hpp"

namespace blobpack { namespace util {

static const size_t CopyBufferSize = 64 * 1024; // in bytes

// Copies [position, position + size) of source to target starting at targetPosition
inline void CopyRange(IStorage const & source, uint64_t position, uint64_t size,
  IStorage & target, uint64_t targetPosition)
{
  std::vector<char> buffer(static_cast<size_t>(std::min<uint64_t>(size, CopyBufferSize)));
  while (size > 0)
  {
    size_t const chunk = static_cast<size_t>(std::min<uint64_t>(size, buffer.size()));
    source.read(position, chunk, buffer.data());
    target.write(targetPosition, chunk, buffer.data());
    position += chunk;
    targetPosition += chunk;
    size -= chunk;
  }
}

}}
