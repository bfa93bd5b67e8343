#pragma once

#include <string>
#include <vector>
#include "blobpack/IStorage.hpp"

namespace blobpack
{

struct ContainerEntry
{
  std::string fileName; // name + extension
  uint64_t offset;      // payload position inside the container
  uint64_t size;
};

// Parses and validates the footer. Entries are in payload order.
// Throws InvalidContainer on any structural inconsistency.
std::vector<ContainerEntry> ReadContainerIndex(IStorage const & container);

}
