#pragma once

#include <cstdint>
#include <string>
#include "format/FileRecord.hpp"

namespace blobpack
{

struct FileRecord
{
  uint64_t size;
  std::string name;
  std::string extension;
};

struct FileNameParts
{
  std::string name;
  std::string extension;
};

// "report.final.txt" -> {"report.final", ".txt"}; ".bashrc" -> {".bashrc", ""}
FileNameParts SplitFileName(std::string const & fileName);

// Name and extension longer than their capacity are truncated.
// Throws InvalidArgument if either contains the sentinel byte.
format::RecordBytes EncodeRecord(FileRecord const & record);

// Throws InvalidContainer if a field isn't terminated within its capacity.
FileRecord DecodeRecord(unsigned char const * bytes);

format::CountBytes EncodeCount(uint64_t count);
uint64_t DecodeCount(unsigned char const * bytes);

}
