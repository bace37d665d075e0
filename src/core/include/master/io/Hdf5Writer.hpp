#pragma once
#include "master/io/IWriter.hpp"
#include "master/io/WriterConfig.hpp"
#include <memory>
#include <string>

/**
 * @file Hdf5Writer.hpp
 * @brief Writes datasets and attributes into ``<path>/<case>.h5``.
 *
 * @details
 * The file is created (truncated) by `open_case()`. Each request creates the missing groups
 * of its path; an existing dataset at the same path is replaced. Doubles are stored as
 * ``H5T_IEEE_F64LE``, integers as ``H5T_STD_I64LE``, strings as fixed-length ASCII.
 *
 * The serial HDF5 library is used; the calculator issues all writes from rank 0.
 *
 * @throws std::runtime_error on any HDF5 failure.
 */

namespace disagg::master::io
{

class Hdf5Writer : public IWriter
{
  public:
    explicit Hdf5Writer(WriterConfig cfg);
    ~Hdf5Writer() override;

    void open_case(const std::string& case_name) override;
    void write(const WriteRequest& req) override;
    void close() override;

    const std::string& file_path() const noexcept;

  private:
    WriterConfig cfg_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace disagg::master::io
