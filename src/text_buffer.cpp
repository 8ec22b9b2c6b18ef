#include "text_buffer.hpp"
#include <algorithm>
#include <unistd.h>
#include <fcntl.h>
#include "posix_fd.hpp"
#include "file_reader.hpp"
#include "config.hpp"

TextBuffer::TextBuffer() { ensure_not_empty(); }

int TextBuffer::line_count() const { return static_cast<int>(lines_.size()); }
const std::string& TextBuffer::line(int r) const { return lines_[static_cast<size_t>(r)]; }

void TextBuffer::ensure_not_empty() {
  if (lines_.empty()) lines_.emplace_back();
}

void TextBuffer::init_from_lines(const std::vector<std::string>& src) {
  lines_ = src;
  ensure_not_empty();
}

void TextBuffer::init_from_lines(std::vector<std::string>&& src) {
  lines_ = std::move(src);
  ensure_not_empty();
}

void TextBuffer::insert_line(int row, const std::string& s) {
  row = std::clamp(row, 0, line_count());
  lines_.insert(lines_.begin() + row, s);
}

void TextBuffer::insert_lines(int row, const std::vector<std::string>& ss) {
  row = std::clamp(row, 0, line_count());
  lines_.insert(lines_.begin() + row, ss.begin(), ss.end());
}

void TextBuffer::erase_line(int row) {
  if (row < 0 || row >= line_count()) return;
  lines_.erase(lines_.begin() + row);
  ensure_not_empty();
}

void TextBuffer::erase_lines(int start_row, int end_row) {
  start_row = std::clamp(start_row, 0, line_count());
  end_row = std::clamp(end_row, start_row, line_count());
  lines_.erase(lines_.begin() + start_row, lines_.begin() + end_row);
  ensure_not_empty();
}

void TextBuffer::replace_line(int row, const std::string& s) {
  if (row < 0 || row >= line_count()) return;
  lines_[static_cast<size_t>(row)] = s;
}

TextBuffer TextBuffer::from_file(const std::filesystem::path& path, std::string& msg, bool& ok) {
  TextBuffer b;
  ok = true;
  std::vector<std::string> ls;
  if (!mmap_readlines(path, ls, msg)) {
    ok = false;
    return b;
  }
  b.init_from_lines(std::move(ls));
  return b;
}

bool TextBuffer::write_file(const std::filesystem::path& path, std::string& msg) const {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd = UniqueFd::open(tmp, O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  auto write_span = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(ufd.get(), p, len);
      if (w < 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  std::string chunk;
  chunk.reserve(static_cast<size_t>(VK_WRITE_CHUNK_SIZE));
  int n = line_count();
  for (int i = 0; i < n; ++i) {
    chunk += lines_[static_cast<size_t>(i)];
    chunk += '\n';
    if (chunk.size() >= static_cast<size_t>(VK_WRITE_CHUNK_SIZE)) {
      if (!write_span(chunk.data(), chunk.size())) return false;
      chunk.clear();
    }
  }
  if (!chunk.empty() && !write_span(chunk.data(), chunk.size())) return false;
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
