#include "ContainerReader.hpp"
#include <utility>
#include "RecordCodec.hpp"
#include "util/Assert.hpp"

namespace blobpack
{

namespace
{
  // Restored files must stay directly inside the target directory
  bool IsPlainFileName(std::string const & fileName)
  {
    return !fileName.empty()
      && fileName != "."
      && fileName != ".."
      && fileName.find('/') == std::string::npos
      && fileName.find('\\') == std::string::npos;
  }
}

std::vector<ContainerEntry> ReadContainerIndex(IStorage const & container)
{
  uint64_t const containerSize = container.size();
  if (containerSize < format::CountFieldSize)
    ThrowContainerError(ErrorCode::InvalidContainer, "Container is too small to hold a footer");

  uint64_t const countPosition = containerSize - format::CountFieldSize;
  format::CountBytes countBytes;
  container.read(countPosition, countBytes.size(), countBytes.data());
  uint64_t const count = DecodeCount(countBytes.data());

  if (count == 0)
    ThrowContainerError(ErrorCode::InvalidContainer, "Container holds no records");
  if (count > countPosition / format::RecordSize)
    ThrowContainerError(ErrorCode::InvalidContainer,
      "Container is too small for " + std::to_string(count) + " records");

  uint64_t const recordsPosition = countPosition - count * format::RecordSize;

  std::vector<ContainerEntry> entries;
  entries.reserve(static_cast<size_t>(count));
  uint64_t offset = 0;
  format::RecordBytes recordBytes;
  for (uint64_t i = 0; i < count; ++i)
  {
    container.read(recordsPosition + i * format::RecordSize, recordBytes.size(), recordBytes.data());
    FileRecord record = DecodeRecord(recordBytes.data());

    if (record.size > recordsPosition - offset)
      ThrowContainerError(ErrorCode::InvalidContainer,
        "Record " + std::to_string(i) + " points past the payload section");

    ContainerEntry entry;
    entry.fileName = record.name + record.extension;
    entry.offset = offset;
    entry.size = record.size;
    if (!IsPlainFileName(entry.fileName))
      ThrowContainerError(ErrorCode::InvalidContainer,
        "Record " + std::to_string(i) + " has invalid file name '" + entry.fileName + "'");

    offset += record.size;
    entries.push_back(std::move(entry));
  }

  return entries;
}

}
