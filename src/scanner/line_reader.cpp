#include "time_window/line_reader.hpp"
#include "time_window/time_parser.hpp"
#include <cerrno>
#include <cstdio>
#include <string_view>
#include <utility>
#include <vector>

namespace tw {

struct LineReader::Impl {
  std::string path;
  Config cfg;
  int last_errno{0};
  std::uint64_t bytes{0};
  std::uint64_t dropped{0};
  std::size_t line_no{0};

  void emit(std::string_view raw, const LineCallback& cb) {
    ++line_no;
    if (cfg.strip_cr && !raw.empty() && raw.back() == '\r') raw.remove_suffix(1);
    std::string_view line = trim(raw);
    if (cfg.skip_blank && line.empty()) return;
    if (cfg.skip_comments && !line.empty() && line.front() == cfg.comment_prefix) return;
    cb(line_no, line);
  }

  bool for_each_line(const LineCallback& cb) {
    FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; return false; }
    line_no = 0;

    std::vector<char> buf(cfg.chunk_bytes, 0);
    std::string carry;
    bool skipping_oversize = false;  // drop until next newline

    while (true) {
      std::size_t n = std::fread(buf.data(), 1, cfg.chunk_bytes, f);
      if (n == 0 && std::ferror(f)) { last_errno = errno; std::fclose(f); return false; }
      if (n == 0) break;
      bytes += n;

      std::string_view block(buf.data(), n);
      std::size_t start = 0;
      while (start <= block.size()) {
        std::size_t pos = block.find('\n', start);
        const bool hit_nl = (pos != std::string_view::npos);
        std::string_view slice = hit_nl ? block.substr(start, pos - start) : block.substr(start);

        if (skipping_oversize) {
          if (!hit_nl) break;
          skipping_oversize = false;
          ++line_no;  // the dropped line still counts
          start = pos + 1;
          continue;
        }

        if (!hit_nl) {
          if (carry.size() + slice.size() > cfg.max_record_bytes) {
            if (cfg.drop_oversize) {
              ++dropped;
              carry.clear();
            } else {
              carry.append(slice.substr(0, cfg.max_record_bytes - carry.size()));
              emit(carry, cb);
              carry.clear();
              --line_no;  // counted again when the newline arrives
            }
            skipping_oversize = true;
          } else {
            carry.append(slice);
          }
          break;
        }

        if (carry.size() + slice.size() > cfg.max_record_bytes) {
          if (cfg.drop_oversize) {
            ++dropped;
            ++line_no;  // the dropped line still counts
          } else {
            carry.append(slice.substr(0, cfg.max_record_bytes - carry.size()));
            emit(carry, cb);
          }
          carry.clear();
        } else if (!carry.empty()) {
          carry.append(slice);
          emit(carry, cb);
          carry.clear();
        } else {
          emit(slice, cb);
        }
        start = pos + 1;
      }
    }

    if (!carry.empty() && !skipping_oversize) emit(carry, cb);
    std::fclose(f);
    return true;
  }
};

LineReader::LineReader(std::string path)
  : LineReader(std::move(path), Config{}) {}

LineReader::LineReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

LineReader::~LineReader() { delete p_; }

bool LineReader::for_each_line(const LineCallback& cb) { return p_->for_each_line(cb); }

bool LineReader::read_rows(std::vector<TabularRow>& out) {
  return for_each_line([&](std::size_t n, std::string_view line) {
    out.push_back(TabularRow{n, std::string(line)});
  });
}

int LineReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t LineReader::bytes_read() const noexcept { return p_->bytes; }
std::uint64_t LineReader::lines_dropped() const noexcept { return p_->dropped; }

}
