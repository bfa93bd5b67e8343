#ifndef _BLOBPACK_API_ISTORAGE_H
#define _BLOBPACK_API_ISTORAGE_H

#include <cstdint>
#include <stddef.h>
#include "blobpack/Common.hpp"

namespace blobpack
{

// Random access byte storage. Containers are assembled and parsed through it.
class IStorage
{
public:
  virtual uint64_t size() const = 0;
  virtual void read(uint64_t position, size_t size, void *) const = 0; // throw if can't read 'size' bytes
  virtual void write(uint64_t position, size_t size, void const *) = 0; // grows storage when writing past the end
  virtual void flush() = 0;

  virtual ~IStorage() {}
};

}

#endif
