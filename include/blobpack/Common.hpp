#ifndef _BLOBPACK_API_COMMON_H
#define _BLOBPACK_API_COMMON_H

#include <stddef.h>

namespace blobpack
{

enum class OpenMode
{
  ReadOnly,
  Create // Creates the file or truncates an existing one
};

const size_t MaxNameSize = 247;      // Longer names are truncated, not rejected
const size_t MaxExtensionSize = 7;   // Including the leading '.'

struct MergeOptions
{
  MergeOptions()
    : noFooter(false)
  {}

  // Write payloads only: no records and no record count. The result can't be split.
  bool noFooter;
};

}

#endif
