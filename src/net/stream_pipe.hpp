#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <mutex>
#include <stdexcept>

// Bounded byte pipe between a producer thread (e.g. a GET body callback) and a
// consumer thread (e.g. a PUT read callback). Either side can fail the pipe;
// the other side then rethrows that error from its next read/write.
class StreamPipe {
public:
    explicit StreamPipe(size_t capacity) : capacity_(std::max<size_t>(1, capacity)) {}

    StreamPipe(const StreamPipe&) = delete;
    StreamPipe& operator=(const StreamPipe&) = delete;

    // Producer side. Blocks while the pipe is full.
    void write(const char* data, size_t len) {
        std::unique_lock<std::mutex> lock(mutex_);
        while (len > 0) {
            space_cv_.wait(lock, [this] { return reader_error_ || buf_.size() < capacity_; });
            if (reader_error_) std::rethrow_exception(reader_error_);

            size_t n = std::min(len, capacity_ - buf_.size());
            buf_.insert(buf_.end(), data, data + n);
            data += n;
            len -= n;
            data_cv_.notify_all();
        }
    }

    // Producer side: no more data.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            eof_ = true;
        }
        data_cv_.notify_all();
    }

    // Producer side: abort the stream. The reader rethrows error.
    void set_writer_error(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!writer_error_) writer_error_ = error;
        }
        data_cv_.notify_all();
    }

    // Consumer side. Blocks until data, end of stream or an error. 0 = EOF.
    size_t read(char* out, size_t len) {
        if (len == 0) throw std::logic_error("StreamPipe::read with zero length");

        std::unique_lock<std::mutex> lock(mutex_);
        data_cv_.wait(lock, [this] { return writer_error_ || !buf_.empty() || eof_; });
        if (writer_error_) std::rethrow_exception(writer_error_);

        size_t n = std::min(len, buf_.size());
        std::copy(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n), out);
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(n));
        space_cv_.notify_all();
        return n;
    }

    // Consumer side: stop the producer. Its next write rethrows error.
    void set_reader_error(std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!reader_error_) reader_error_ = error;
        }
        space_cv_.notify_all();
    }

private:
    const size_t capacity_;
    std::mutex mutex_;
    std::condition_variable data_cv_;
    std::condition_variable space_cv_;
    std::deque<char> buf_;
    bool eof_ = false;
    std::exception_ptr writer_error_;
    std::exception_ptr reader_error_;
};
