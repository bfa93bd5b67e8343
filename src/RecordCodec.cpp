#include "RecordCodec.hpp"
#include <algorithm>
#include <boost/endian/conversion.hpp>
#include "util/Assert.hpp"

namespace blobpack
{

namespace
{
  void EncodeField(std::string const & value, size_t capacity, unsigned char * field, const char * fieldName)
  {
    if (value.find(static_cast<char>(format::Sentinel)) != std::string::npos)
      ThrowContainerError(ErrorCode::InvalidArgument,
        std::string("File ") + fieldName + " contains zero byte");

    size_t const length = std::min(value.size(), capacity);
    auto const last = std::copy_n(value.data(), length, reinterpret_cast<char *>(field));
    // Terminator and the unused tail of the field
    std::fill(reinterpret_cast<unsigned char *>(last), field + capacity + 1, format::Sentinel);
  }

  std::string DecodeField(unsigned char const * field, size_t fieldSize)
  {
    unsigned char const * const end = field + fieldSize;
    unsigned char const * const terminator = std::find(field, end, format::Sentinel);
    BLOBPACK_FORMAT_ASSERT(terminator != end);
    return std::string(reinterpret_cast<const char *>(field), terminator - field);
  }
}

FileNameParts SplitFileName(std::string const & fileName)
{
  FileNameParts parts;
  std::string::size_type const dot = fileName.rfind('.');
  if (dot == std::string::npos || dot == 0 || fileName == "..")
  {
    parts.name = fileName;
  }
  else
  {
    parts.name = fileName.substr(0, dot);
    parts.extension = fileName.substr(dot);
  }
  return parts;
}

format::RecordBytes EncodeRecord(FileRecord const & record)
{
  format::RecordBytes bytes;
  boost::endian::store_big_u64(bytes.data() + format::SizeFieldOffset, record.size);
  EncodeField(record.name, MaxNameSize, bytes.data() + format::NameFieldOffset, "name");
  EncodeField(record.extension, MaxExtensionSize, bytes.data() + format::ExtensionFieldOffset, "extension");
  return bytes;
}

FileRecord DecodeRecord(unsigned char const * bytes)
{
  FileRecord record;
  record.size = boost::endian::load_big_u64(bytes + format::SizeFieldOffset);
  record.name = DecodeField(bytes + format::NameFieldOffset, format::NameFieldSize);
  record.extension = DecodeField(bytes + format::ExtensionFieldOffset, format::ExtensionFieldSize);
  return record;
}

format::CountBytes EncodeCount(uint64_t count)
{
  format::CountBytes bytes;
  boost::endian::store_big_u64(bytes.data(), count);
  return bytes;
}

uint64_t DecodeCount(unsigned char const * bytes)
{
  return boost::endian::load_big_u64(bytes);
}

}
