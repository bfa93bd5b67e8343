#ifndef _BLOBPACK_API_MERGER_H
#define _BLOBPACK_API_MERGER_H

#include <string>
#include <vector>
#include "blobpack/Common.hpp"
#include "blobpack/Defs.hpp"

namespace blobpack
{

// Packs regular files into a single container at targetPath. Payloads are written
// in the order given, followed by one record per file and the record count.
// Missing directories on the way to targetPath are created.
// Throws ContainerError.
BLOBPACK_API_DECL void Merge(std::vector<std::string> const & sourcePaths, const char * targetPath,
  MergeOptions const & options = MergeOptions());

}

#endif
