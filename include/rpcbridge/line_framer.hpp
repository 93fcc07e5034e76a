#pragma once

#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace rpcbridge {

/** @brief Reassemble newline-terminated lines from arbitrary chunks.
 *
 * Bytes are pushed with feed() as they arrive; next() hands back each
 * complete line without its terminator (a trailing @c '\r' is stripped too).
 * Blank lines are skipped.  A line that grows past @c max_line bytes
 * without a terminator is thrown away up to the next @c '\n' and counted in
 * discarded().
 */
class line_framer {
 public:
  static constexpr std::size_t default_max_line{64UL * 1024 * 1024};

  explicit line_framer(std::size_t max_line = default_max_line)
      : max_line_{max_line} {}

  void feed(std::string_view bytes);

  std::optional<std::string> next();

  // Called once the stream is closed: the unterminated tail, if any.
  std::optional<std::string> finish();

  [[nodiscard]] std::size_t discarded() const { return discarded_; }
  [[nodiscard]] std::size_t buffered() const { return buf_.size() - pos_; }

 private:
  void compact();

  std::string buf_;
  std::size_t pos_{0};   // start of the first unconsumed byte
  std::size_t scan_{0};  // bytes after pos_ already known to hold no '\n'
  std::size_t max_line_;
  std::size_t discarded_{0};
  bool skipping_{false};
};

/** @brief Lazy sequence of lines read from a blocking stream.
 *
 * @c SyncReadStream is anything with Asio's @c read_some(buffer, ec), e.g.
 * @c boost::asio::readable_pipe.  next() blocks for the next complete line
 * and returns an empty optional once the stream has reached EOF (or failed)
 * and every buffered line has been handed out.  Construct a new reader for
 * each stream.
 */
template <typename SyncReadStream>
class line_reader {
 public:
  explicit line_reader(
      SyncReadStream& stream,
      std::size_t max_line = line_framer::default_max_line)
      : stream_{&stream}, framer_{max_line} {}

  std::optional<std::string> next() {
    for (;;) {
      if (auto line = framer_.next()) return line;
      if (closed_) return framer_.finish();

      std::array<char, 8192> chunk{};
      boost::system::error_code ec{};
      auto n = stream_->read_some(boost::asio::buffer(chunk), ec);
      if (n > 0) framer_.feed({chunk.data(), n});
      if (ec) {
        closed_ = true;
        error_ = ec;
      }
    }
  }

  // Why the stream ended: asio::error::eof for a clean close.
  [[nodiscard]] const boost::system::error_code& error() const {
    return error_;
  }
  [[nodiscard]] std::size_t discarded() const { return framer_.discarded(); }

 private:
  SyncReadStream* stream_;
  line_framer framer_;
  boost::system::error_code error_{};
  bool closed_{false};
};

}  // namespace rpcbridge
