#pragma once
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

#include "master/io/IWriter.hpp"

/**
 * @file AsyncWriter.hpp
 * @brief Threaded writer decorator with bounded queue and backpressure.
 *
 * @details
 * Wraps any :cpp:class:`IWriter`. `open_case()` spawns a worker thread; `write()` enqueues
 * requests; `close()` drains the queue, joins the thread and closes the sink. An exception
 * thrown by the sink stops the worker and is rethrown by the next `write()` or by `close()`.
 *
 * @rst
 * .. code-block:: cpp
 *
 *   auto sink = std::make_unique<Hdf5Writer>(cfg);
 *   AsyncWriter W(std::move(sink), {.max_queue = 64});
 *   W.open_case("disagg");
 *   W.write(req); // returns quickly
 *   W.close();    // flush & join
 * @endrst
 */

namespace disagg::master::io
{

class AsyncWriter : public IWriter
{
  public:
    /// \cond DOXYGEN_EXCLUDE
    struct Options
    {
        std::size_t max_queue = 16; // 0 = unbounded; a full queue blocks write()
    };

    explicit AsyncWriter(std::unique_ptr<IWriter> sink);
    AsyncWriter(std::unique_ptr<IWriter> sink, Options o);
    /// \endcond

    ~AsyncWriter() override;

    void open_case(const std::string& case_name) override;
    void write(const WriteRequest& req) override;
    void close() override;

  private:
    Options opt_;
    std::unique_ptr<IWriter> sink_;
    std::thread worker_;
    std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<WriteRequest> q_;
    std::atomic<bool> stop_{false};
    std::exception_ptr error_;

    void run_();
    void rethrow_if_failed_();
};

} // namespace disagg::master::io
