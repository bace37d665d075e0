#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/**
 * @file IWriter.hpp
 * @brief Output abstraction used by the calculator.
 *
 * @details
 * A :cpp:struct:`WriteRequest` names an object by its ``/``-separated path inside the case
 * file. With a non-empty ``shape`` it is a dataset holding ``data``; with an empty shape only
 * the attributes are written, on the group at ``path``. Writers create intermediate groups as
 * needed. The base interface is synchronous; use :cpp:class:`AsyncWriter` as a decorator for
 * background I/O.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   using disagg::master::io::IWriter;
 *   struct CountingWriter : IWriter {
 *     int writes = 0;
 *     void open_case(const std::string&) override {}
 *     void write(const WriteRequest&) override { ++writes; }
 *     void close() override {}
 *   };
 * @endrst
 */

namespace disagg::master::io
{

using AttrValue =
    std::variant<std::int64_t, double, std::string, std::vector<double>, std::vector<std::string>>;
using Attrs = std::vector<std::pair<std::string, AttrValue>>;

struct WriteRequest
{
    std::string path;               // e.g. "disagg/PGA-sid-0-poe-0/Mag"
    std::vector<std::size_t> shape; // empty = attributes on a group
    std::variant<std::vector<double>, std::vector<std::int64_t>> data;
    Attrs attrs;

    bool is_group() const noexcept { return shape.empty(); }
};

class IWriter
{
  public:
    virtual ~IWriter() = default;

    virtual void open_case(const std::string& case_name) = 0;
    virtual void write(const WriteRequest& req) = 0; // blocking in the base interface
    virtual void close() = 0;
};

} // namespace disagg::master::io
