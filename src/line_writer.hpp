// ──────────────────────────  line_writer.hpp  (C++17)  ──────────────────────
#ifndef STREAM_RUNNER_LINE_WRITER_HPP
#define STREAM_RUNNER_LINE_WRITER_HPP

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>

namespace stream_runner {

class Sink;

// ───────────────────────  LineTimestampWriter  ─────────────────────────
/*
 *  Splits an arbitrary byte stream into lines and forwards every non-empty
 *  one as "[<timestamp>] [<id>] <line>\n".  A trailing fragment without a
 *  newline stays buffered until a later write() completes it.
 *
 *  Use one instance per {worker, stdout|stderr}: the mutex keeps a single
 *  stream line-atomic, and the sink is expected to be safe for concurrent
 *  writers (LogFile is).
 */
class LineTimestampWriter {
public:
    LineTimestampWriter(std::string id, Sink& sink)
        : id_(std::move(id)), sink_(sink) {}

    LineTimestampWriter(const LineTimestampWriter&) = delete;
    LineTimestampWriter& operator=(const LineTimestampWriter&) = delete;

    // Returns data.size(); throws std::system_error if the sink fails.
    std::size_t write(std::string_view data);

    std::size_t pending() const;

private:
    const std::string id_;
    Sink&             sink_;

    mutable std::mutex mu_;
    std::string        buf_;
};

} // namespace stream_runner

#endif
