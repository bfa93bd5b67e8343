#ifndef _BLOBPACK_API_SPLITTER_H
#define _BLOBPACK_API_SPLITTER_H

#include "blobpack/Defs.hpp"

namespace blobpack
{

// Restores the files packed in containerPath into targetDirectory (created if absent).
// Container metadata is validated before any file is created.
// Throws ContainerError.
BLOBPACK_API_DECL void Split(const char * containerPath, const char * targetDirectory);

}

#endif
