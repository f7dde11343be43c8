#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace replica::net {

// Splits a byte stream into '\n' terminated lines. A trailing '\r' is
// dropped; the partial tail waits for the next Append.
class LineFramer final {
public:
    static constexpr std::size_t kDefaultMaxLineBytes = 16 * 1024 * 1024;

    explicit LineFramer(std::size_t max_line_bytes = kDefaultMaxLineBytes);

    // Fails once the unterminated tail grows past the line limit.
    bool Append(std::string_view bytes, std::string& out_error);
    bool PopLine(std::string& out_line);

    std::size_t BufferedBytes() const;
    void Clear();

private:
    std::size_t max_line_bytes_ = kDefaultMaxLineBytes;
    std::string buffer_;
    std::size_t read_offset_ = 0;
};

}  // namespace replica::net
