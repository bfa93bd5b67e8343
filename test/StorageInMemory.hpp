#pragma once

#include <string>
#include <vector>
#include "blobpack/IStorage.hpp"

class StorageInMemory: public blobpack::IStorage
{
public:
  StorageInMemory() {}
  explicit StorageInMemory(std::string const & content);

  uint64_t size() const override { return m_data.size(); }
  void read(uint64_t position, size_t size, void *) const override;
  void write(uint64_t position, size_t size, void const *) override;
  void flush() override {}

  std::vector<char> & data() { return m_data; }
  std::string str() const { return std::string(m_data.begin(), m_data.end()); }

private:
  std::vector<char> m_data;
};
