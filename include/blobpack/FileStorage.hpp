#ifndef _BLOBPACK_API_FILE_STORAGE_H
#define _BLOBPACK_API_FILE_STORAGE_H

#include <memory>
#include "blobpack/Common.hpp"
#include "blobpack/Defs.hpp"
#include "blobpack/IStorage.hpp"

namespace blobpack
{

// ReadOnly: SourceNotFound, InvalidArgument (directory) or SourceUnreadable on failure.
// Create: DestinationWriteError on failure.
BLOBPACK_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const char * fileName, OpenMode);
BLOBPACK_API_DECL std::unique_ptr<IStorage> OpenFileStorage(const wchar_t * fileName, OpenMode);

}

#endif
