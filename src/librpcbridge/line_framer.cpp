#include "rpcbridge/line_framer.hpp"

namespace rpcbridge {

namespace {

std::string_view strip_cr(std::string_view line) {
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

}  // namespace

void line_framer::feed(std::string_view bytes) {
  compact();
  buf_.append(bytes);
}

std::optional<std::string> line_framer::next() {
  for (;;) {
    std::string_view pending{buf_};
    pending.remove_prefix(pos_);
    auto nl = pending.find('\n', scan_);
    if (nl == std::string_view::npos) {
      scan_ = pending.size();
      if (pending.size() > max_line_) {
        // Overlong line: drop what we have and keep dropping until '\n'.
        if (!skipping_) ++discarded_;
        skipping_ = true;
        pos_ = buf_.size();
        scan_ = 0;
      }
      return std::nullopt;
    }

    auto line = strip_cr(pending.substr(0, nl));
    pos_ += nl + 1;
    scan_ = 0;

    if (skipping_) {
      skipping_ = false;
      continue;
    }
    if (line.size() > max_line_) {
      ++discarded_;
      continue;
    }
    if (line.empty()) continue;
    return std::string{line};
  }
}

std::optional<std::string> line_framer::finish() {
  std::string_view pending{buf_};
  pending.remove_prefix(pos_);
  std::optional<std::string> tail{};
  if (auto rest = strip_cr(pending); !skipping_ && !rest.empty())
    tail = std::string{rest};
  buf_.clear();
  pos_ = 0;
  scan_ = 0;
  skipping_ = false;
  return tail;
}

void line_framer::compact() {
  if (pos_ == 0) return;
  buf_.erase(0, pos_);
  pos_ = 0;
}

}  // namespace rpcbridge
