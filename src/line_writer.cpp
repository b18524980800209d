// ────────────────────────  line_writer.cpp  (C++17)  ────────────────────────
#include "line_writer.hpp"
#include "log.hpp"
#include "sink.hpp"

namespace stream_runner {

std::size_t LineTimestampWriter::write(std::string_view data)
{
    std::lock_guard<std::mutex> lk(mu_);
    buf_.append(data.data(), data.size());

    std::size_t start = 0;
    for (auto nl = buf_.find('\n'); nl != std::string::npos; nl = buf_.find('\n', start)) {
        std::string_view line(buf_.data() + start, nl - start);
        start = nl + 1;
        if (line.empty()) continue;

        std::string out;
        out.reserve(line.size() + id_.size() + 26);
        out += '[';
        out += log::timestamp();
        out += "] [";
        out += id_;
        out += "] ";
        out += line;
        out += '\n';
        try {
            sink_.write(out);
        } catch (...) {
            buf_.erase(0, start);
            throw;
        }
    }
    buf_.erase(0, start);
    return data.size();
}

std::size_t LineTimestampWriter::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return buf_.size();
}

} // namespace stream_runner
