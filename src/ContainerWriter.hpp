#pragma once

#include <vector>
#include "blobpack/IStorage.hpp"
#include "format/FileRecord.hpp"

namespace blobpack
{

// Appends payloads and then the footer to a container being assembled
class ContainerWriter
{
public:
  explicit ContainerWriter(IStorage & target);

  ContainerWriter(ContainerWriter const &) = delete;
  void operator =(ContainerWriter const &) = delete;

  // Copies the first 'size' bytes of source
  void appendPayload(IStorage const & source, uint64_t size);
  // Records in payload order, then the record count
  void appendFooter(std::vector<format::RecordBytes> const & records);

  uint64_t position() const { return m_position; }

private:
  IStorage & m_target;
  uint64_t m_position;
};

}
