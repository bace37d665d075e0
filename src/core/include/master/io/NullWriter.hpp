#pragma once
#include "master/io/IWriter.hpp"
#include <cstddef>

namespace disagg::master::io {

/// Discards everything; counts requests (dry runs and benchmarks)
class NullWriter final : public IWriter {
public:
  void open_case(const std::string&) override {}
  void write(const WriteRequest&) override { ++count_; }
  void close() override {}
  std::size_t count() const noexcept { return count_; }

private:
  std::size_t count_ = 0;
};

} // namespace disagg::master::io
