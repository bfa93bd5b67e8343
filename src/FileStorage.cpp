#include "blobpack/FileStorage.hpp"
#include <algorithm>
#include <fstream>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "util/Assert.hpp"

namespace blobpack
{

namespace fs = boost::filesystem;

class FileStorage: public IStorage
{
public:
  FileStorage(fs::path const & fileName, OpenMode openMode)
    : m_fileName(fileName)
    , m_openMode(openMode)
    , m_size(0)
  {
    if (m_openMode == OpenMode::ReadOnly)
      checkSource();

    m_stream.exceptions(std::fstream::failbit | std::fstream::badbit);
    try
    {
      open();
      m_stream.seekg(0, std::ios_base::end);
      m_size = static_cast<uint64_t>(m_stream.tellg());
    }
    catch (std::ios_base::failure const &)
    {
      if (m_openMode == OpenMode::ReadOnly)
        ThrowContainerError(ErrorCode::SourceUnreadable, "Can't open file for reading: " + m_fileName.string());
      else
        ThrowContainerError(ErrorCode::DestinationWriteError, "Can't create file: " + m_fileName.string());
    }
  }

  uint64_t size() const override { return m_size; }

  void read(uint64_t position, size_t size, void * data) const override
  {
    if (position > m_size || size > m_size - position)
      ThrowContainerError(ErrorCode::SourceUnreadable, "Unexpected end of file: " + m_fileName.string());

    try
    {
      m_stream.seekg(position);
      m_stream.read(reinterpret_cast<char *>(data), size);
    }
    catch (std::ios_base::failure const &)
    {
      ThrowContainerError(ErrorCode::SourceUnreadable, "Failed to read file: " + m_fileName.string());
    }
  }

  void write(uint64_t position, size_t size, void const * data) override
  {
    if (m_openMode == OpenMode::ReadOnly)
      ThrowContainerError(ErrorCode::InvalidArgument, "File is opened read-only: " + m_fileName.string());

    try
    {
      m_stream.seekp(position);
      m_stream.write(reinterpret_cast<const char *>(data), size);
    }
    catch (std::ios_base::failure const &)
    {
      ThrowContainerError(ErrorCode::DestinationWriteError, "Failed to write file: " + m_fileName.string());
    }
    m_size = std::max(m_size, position + size);
  }

  void flush() override
  {
    if (m_openMode == OpenMode::ReadOnly)
      return;

    try
    {
      m_stream.flush();
    }
    catch (std::ios_base::failure const &)
    {
      ThrowContainerError(ErrorCode::DestinationWriteError, "Failed to write file: " + m_fileName.string());
    }
  }

private:
  fs::path const m_fileName;
  OpenMode const m_openMode;
  mutable fs::fstream m_stream;
  uint64_t m_size;

  void checkSource() const
  {
    boost::system::error_code ec;
    fs::file_status const status = fs::status(m_fileName, ec);
    if (status.type() == fs::file_not_found)
      ThrowContainerError(ErrorCode::SourceNotFound, "File not found: " + m_fileName.string());
    if (status.type() == fs::directory_file)
      ThrowContainerError(ErrorCode::InvalidArgument, "Path is a directory: " + m_fileName.string());
    // Other status errors surface when the stream is opened
  }

  void open()
  {
    std::ios_base::openmode openmode = std::ios_base::binary | std::ios_base::in;
    if (m_openMode == OpenMode::Create)
      openmode |= std::ios_base::out | std::ios_base::trunc;
    m_stream.open(m_fileName, openmode);
  }
};

std::unique_ptr<IStorage> OpenFileStorage(const char * fileName, OpenMode openMode)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName, openMode));
}

std::unique_ptr<IStorage> OpenFileStorage(const wchar_t * fileName, OpenMode openMode)
{
  return std::unique_ptr<IStorage>(new FileStorage(fileName, openMode));
}

}
