#include "net/line_framer.h"

namespace replica::net {

LineFramer::LineFramer(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes) {}

bool LineFramer::Append(std::string_view bytes, std::string& out_error) {
    if (read_offset_ > 0) {
        buffer_.erase(0, read_offset_);
        read_offset_ = 0;
    }

    buffer_.append(bytes.data(), bytes.size());

    const std::string::size_type last_newline = buffer_.rfind('\n');
    const std::size_t tail_size =
        last_newline == std::string::npos ? buffer_.size() : buffer_.size() - last_newline - 1;
    if (tail_size > max_line_bytes_) {
        out_error = "line exceeds " + std::to_string(max_line_bytes_) + " bytes";
        return false;
    }

    out_error.clear();
    return true;
}

bool LineFramer::PopLine(std::string& out_line) {
    const std::string::size_type newline = buffer_.find('\n', read_offset_);
    if (newline == std::string::npos) {
        return false;
    }

    std::string::size_type line_end = newline;
    if (line_end > read_offset_ && buffer_[line_end - 1] == '\r') {
        --line_end;
    }

    out_line.assign(buffer_, read_offset_, line_end - read_offset_);
    read_offset_ = newline + 1;
    return true;
}

std::size_t LineFramer::BufferedBytes() const {
    return buffer_.size() - read_offset_;
}

void LineFramer::Clear() {
    buffer_.clear();
    read_offset_ = 0;
}

}  // namespace replica::net
