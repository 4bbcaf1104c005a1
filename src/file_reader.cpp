#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cstring>
#include <future>
#include <thread>

namespace {

// Read-only private mapping of a whole file. The descriptor is closed as soon
// as the mapping exists; an empty file maps nothing and stays valid.
class MappedFile {
public:
  bool open(const std::filesystem::path& path, std::string& msg) {
    int fd = ::open(path.string().c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) { msg = "can not open file: " + path.string(); return false; }
    struct stat st{};
    bool ok = false;
    if (::fstat(fd, &st) != 0) msg = "can not read file stat: " + path.string();
    else if (S_ISDIR(st.st_mode)) msg = "is a directory: " + path.string();
    else {
      size_ = static_cast<size_t>(st.st_size);
      if (size_ == 0) ok = true;
      else {
        void* mem = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        if (mem == MAP_FAILED) msg = "can not mmap file: " + path.string();
        else { mem_ = mem; ok = true; }
      }
    }
    ::close(fd);
    return ok;
  }
  MappedFile() = default;
  ~MappedFile() { if (mem_) ::munmap(mem_, size_); }
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  const char* data() const { return static_cast<const char*>(mem_); }
  size_t size() const { return size_; }
private:
  void* mem_ = nullptr;
  size_t size_ = 0;
};

void push_line(const char* data, size_t start, size_t end, std::vector<std::string>& out) {
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data + start, end - start);
}

// Splits [s, e) on '\n'; the final partial line is left to the caller.
size_t split_range(const char* data, size_t s, size_t e, std::vector<std::string>& out) {
  size_t start = s;
  while (start < e) {
    const void* hit = std::memchr(data + start, '\n', e - start);
    if (!hit) break;
    size_t pos = static_cast<size_t>(static_cast<const char*>(hit) - data);
    push_line(data, start, pos, out);
    start = pos + 1;
  }
  return start;
}

}  // namespace

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  MappedFile map;
  if (!map.open(path, msg)) return false;
  size_t n = map.size();
  if (n == 0) { out_lines.emplace_back(""); msg = "opened " + path.string(); return true; }
  const char* data = map.data();
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);

  const size_t min_parallel_size = 1 << 20;
  unsigned hw = std::max(1u, std::thread::hardware_concurrency());
  if (n < min_parallel_size || hw == 1) {
    size_t rest = split_range(data, 0, n, out_lines);
    push_line(data, rest, n, out_lines);
  } else {
    // chunk boundaries are moved to just past a newline so no line is split
    unsigned chunks = std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size) + 1);
    std::vector<size_t> bounds{0};
    for (unsigned t = 1; t < chunks; ++t) {
      size_t b = std::max(bounds.back(), n * t / chunks);
      const void* hit = std::memchr(data + b, '\n', n - b);
      if (!hit) break;
      bounds.push_back(static_cast<size_t>(static_cast<const char*>(hit) - data) + 1);
    }
    bounds.push_back(n);
    std::vector<std::vector<std::string>> parts(bounds.size() - 1);
    std::vector<std::future<size_t>> futs;
    for (size_t i = 0; i + 1 < bounds.size(); ++i) {
      futs.emplace_back(std::async(std::launch::async, [&, i]{
        return split_range(data, bounds[i], bounds[i + 1], parts[i]);
      }));
    }
    size_t rest = 0;
    for (auto& f : futs) rest = f.get();
    for (auto& p : parts) {
      out_lines.insert(out_lines.end(), std::make_move_iterator(p.begin()), std::make_move_iterator(p.end()));
    }
    push_line(data, rest, n, out_lines);
  }
  if (std::memchr(data, '\0', std::min<size_t>(n, 8192))) {
    msg = "opened binary file: " + path.string();
    return true;
  }
  msg = "opened " + path.string();
  return true;
}

bool list_directory(const std::filesystem::path& path,
                    std::vector<std::string>& out_entries,
                    std::string& msg) {
  out_entries.clear();
  std::error_code ec;
  std::filesystem::directory_iterator it(path, ec), end;
  if (ec) { msg = "can not list directory: " + path.string(); return false; }
  for (; it != end; it.increment(ec)) {
    if (ec) { msg = "can not list directory: " + path.string(); return false; }
    std::string name = it->path().filename().string();
    if (it->is_directory(ec)) name += "/";
    out_entries.push_back(std::move(name));
  }
  std::sort(out_entries.begin(), out_entries.end());
  msg = "listed " + path.string();
  return true;
}
