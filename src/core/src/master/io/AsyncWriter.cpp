#include "master/io/AsyncWriter.hpp"

namespace disagg::master::io
{

AsyncWriter::AsyncWriter(std::unique_ptr<IWriter> sink) : AsyncWriter(std::move(sink), Options{}) {}

AsyncWriter::AsyncWriter(std::unique_ptr<IWriter> sink, Options o) : opt_(o), sink_(std::move(sink))
{
}

AsyncWriter::~AsyncWriter()
{
    // sink errors surface through close()
    if (worker_.joinable())
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
        worker_.join();
    }
}

void AsyncWriter::open_case(const std::string& case_name)
{
    if (sink_)
        sink_->open_case(case_name);
    stop_ = false;
    error_ = nullptr;
    worker_ = std::thread([this] { run_(); });
}

void AsyncWriter::rethrow_if_failed_()
{
    std::exception_ptr e;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        e = error_;
        error_ = nullptr;
    }
    if (e)
        std::rethrow_exception(e);
}

void AsyncWriter::write(const WriteRequest& req)
{
    rethrow_if_failed_();
    if (!sink_ || stop_)
        return;
    {
        std::unique_lock<std::mutex> lk(mtx_);
        if (opt_.max_queue && q_.size() >= opt_.max_queue)
        {
            cv_.wait(lk, [&] { return q_.size() < opt_.max_queue || stop_; });
            if (stop_)
                return;
        }
        q_.push(req);
    }
    cv_.notify_one();
}

void AsyncWriter::close()
{
    if (worker_.joinable())
    {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
        worker_.join();
    }
    if (sink_)
        sink_->close();
    rethrow_if_failed_();
}

void AsyncWriter::run_()
{
    while (true)
    {
        WriteRequest req;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&] { return stop_ || !q_.empty(); });
            if (q_.empty())
                break;
            req = std::move(q_.front());
            q_.pop();
        }
        try
        {
            sink_->write(req);
        }
        catch (...)
        {
            std::lock_guard<std::mutex> lk(mtx_);
            error_ = std::current_exception();
            stop_ = true;
            std::queue<WriteRequest>().swap(q_);
        }
        cv_.notify_all(); // wake producer waiting on queue space
    }
}

} // namespace disagg::master::io
