#include "counters/procfs_provider.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <unistd.h>

#include "core/error.hpp"
#include "core/log.hpp"
#include "core/strings.hpp"
#include "core/timestamp.hpp"

namespace perf_sampler::counters {
namespace {

constexpr const char* kLogTag = "procfs";
constexpr std::size_t kReadChunkSize = 4096;
constexpr std::size_t kProcessStatFieldCount = 21;  // fields 4..24 of <pid>/stat

enum class Source : std::uint8_t {
  process_stat,
  process_io,
  process_fd,
  cpu_stat,
  system_stat,
  meminfo,
  vmstat,
  uptime,
  process_count,
  net_dev,
};

enum class Field : std::uint8_t {
  process_id,
  process_cpu,
  process_user,
  process_privileged,
  thread_count,
  working_set,
  virtual_bytes,
  process_page_faults,
  process_elapsed,
  io_read_bytes,
  io_write_bytes,
  handle_count,
  cpu_busy,
  cpu_idle,
  cpu_user,
  cpu_privileged,
  cpu_interrupt,
  available_bytes,
  available_mbytes,
  committed_bytes,
  commit_limit,
  committed_in_use,
  memory_page_faults,
  context_switches,
  run_queue,
  process_count,
  up_time,
  rx_bytes,
  tx_bytes,
  total_bytes,
  rx_packets,
  tx_packets,
};

struct CategoryDefinition {
  const char* name;
  bool multi_instance;
};

struct CounterDefinition {
  const char* category;
  const char* counter;
  CounterType type;
  Source source;
  Field field;
};

constexpr std::array<CategoryDefinition, 5> kCategories{{
    {"Process", true},
    {"Processor", true},
    {"Memory", false},
    {"System", false},
    {"Network Interface", true},
}};

constexpr std::array<CounterDefinition, 32> kCatalogue{{
    {"Process", "ID Process", CounterType::number_of_items, Source::process_stat, Field::process_id},
    {"Process", "% Processor Time", CounterType::timer, Source::process_stat, Field::process_cpu},
    {"Process", "% User Time", CounterType::timer, Source::process_stat, Field::process_user},
    {"Process", "% Privileged Time", CounterType::timer, Source::process_stat, Field::process_privileged},
    {"Process", "Thread Count", CounterType::number_of_items, Source::process_stat, Field::thread_count},
    {"Process", "Working Set", CounterType::number_of_items, Source::process_stat, Field::working_set},
    {"Process", "Virtual Bytes", CounterType::number_of_items, Source::process_stat, Field::virtual_bytes},
    {"Process", "Page Faults/sec", CounterType::rate_per_second, Source::process_stat, Field::process_page_faults},
    {"Process", "Elapsed Time", CounterType::elapsed_time, Source::process_stat, Field::process_elapsed},
    {"Process", "IO Read Bytes/sec", CounterType::rate_per_second, Source::process_io, Field::io_read_bytes},
    {"Process", "IO Write Bytes/sec", CounterType::rate_per_second, Source::process_io, Field::io_write_bytes},
    {"Process", "Handle Count", CounterType::number_of_items, Source::process_fd, Field::handle_count},
    {"Processor", "% Processor Time", CounterType::sample_fraction, Source::cpu_stat, Field::cpu_busy},
    {"Processor", "% Idle Time", CounterType::sample_fraction, Source::cpu_stat, Field::cpu_idle},
    {"Processor", "% User Time", CounterType::sample_fraction, Source::cpu_stat, Field::cpu_user},
    {"Processor", "% Privileged Time", CounterType::sample_fraction, Source::cpu_stat, Field::cpu_privileged},
    {"Processor", "% Interrupt Time", CounterType::sample_fraction, Source::cpu_stat, Field::cpu_interrupt},
    {"Memory", "Available Bytes", CounterType::number_of_items, Source::meminfo, Field::available_bytes},
    {"Memory", "Available MBytes", CounterType::number_of_items, Source::meminfo, Field::available_mbytes},
    {"Memory", "Committed Bytes", CounterType::number_of_items, Source::meminfo, Field::committed_bytes},
    {"Memory", "Commit Limit", CounterType::number_of_items, Source::meminfo, Field::commit_limit},
    {"Memory", "% Committed Bytes In Use", CounterType::raw_fraction, Source::meminfo, Field::committed_in_use},
    {"Memory", "Page Faults/sec", CounterType::rate_per_second, Source::vmstat, Field::memory_page_faults},
    {"System", "Context Switches/sec", CounterType::rate_per_second, Source::system_stat, Field::context_switches},
    {"System", "Processor Queue Length", CounterType::number_of_items, Source::system_stat, Field::run_queue},
    {"System", "Processes", CounterType::number_of_items, Source::process_count, Field::process_count},
    {"System", "System Up Time", CounterType::elapsed_time, Source::uptime, Field::up_time},
    {"Network Interface", "Bytes Received/sec", CounterType::rate_per_second, Source::net_dev, Field::rx_bytes},
    {"Network Interface", "Bytes Sent/sec", CounterType::rate_per_second, Source::net_dev, Field::tx_bytes},
    {"Network Interface", "Bytes Total/sec", CounterType::rate_per_second, Source::net_dev, Field::total_bytes},
    {"Network Interface", "Packets Received/sec", CounterType::rate_per_second, Source::net_dev, Field::rx_packets},
    {"Network Interface", "Packets Sent/sec", CounterType::rate_per_second, Source::net_dev, Field::tx_packets},
}};

struct ProcessStat {
  std::int64_t pid{0};
  std::string name;
  std::uint64_t minflt{0};
  std::uint64_t majflt{0};
  std::uint64_t utime{0};
  std::uint64_t stime{0};
  std::uint64_t num_threads{0};
  std::uint64_t starttime{0};
  std::uint64_t vsize{0};
  std::uint64_t rss{0};
};

struct CpuTimes {
  std::uint64_t user{0};
  std::uint64_t nice{0};
  std::uint64_t system{0};
  std::uint64_t idle{0};
  std::uint64_t iowait{0};
  std::uint64_t irq{0};
  std::uint64_t softirq{0};
  std::uint64_t steal{0};

  [[nodiscard]] std::uint64_t idle_total() const noexcept { return idle + iowait; }
  [[nodiscard]] std::uint64_t busy() const noexcept { return user + nice + system + irq + softirq + steal; }
  [[nodiscard]] std::uint64_t total() const noexcept { return idle_total() + busy(); }
};

struct NetDevRow {
  std::string name;
  std::uint64_t rx_bytes{0};
  std::uint64_t rx_packets{0};
  std::uint64_t tx_bytes{0};
  std::uint64_t tx_packets{0};
};

// What an open handle reads: one process, one cpu line, one interface, or the aggregate.
struct Binding {
  bool total{false};
  std::int64_t pid{0};
  std::uint64_t starttime{0};
  std::string key{};
  std::string instance{};
};

struct FileCloser {
  void operator()(std::FILE* file) const {
    if (file != nullptr) {
      std::fclose(file);
    }
  }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

std::int64_t clock_tick_ns() {
  static const std::int64_t value = [] {
    const long ticks_per_second = ::sysconf(_SC_CLK_TCK);
    return core::kMonotonicFrequency / (ticks_per_second > 0 ? ticks_per_second : 100);
  }();
  return value;
}

std::int64_t page_size_bytes() {
  static const std::int64_t value = [] {
    const long size = ::sysconf(_SC_PAGESIZE);
    return static_cast<std::int64_t>(size > 0 ? size : 4096);
  }();
  return value;
}

bool is_time_based(const CounterType type) noexcept {
  return type != CounterType::number_of_items && type != CounterType::raw_fraction;
}

bool is_all_digits(const std::string_view text) noexcept {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool read_stream(std::FILE* file, std::string& out) {
  if (std::fseek(file, 0L, SEEK_SET) != 0) {
    return false;
  }

  out.clear();
  char buffer[kReadChunkSize];
  for (;;) {
    const std::size_t bytes_read = std::fread(buffer, 1, sizeof(buffer), file);
    out.append(buffer, bytes_read);
    if (bytes_read < sizeof(buffer)) {
      break;
    }
  }

  if (std::ferror(file) != 0) {
    std::clearerr(file);
    return false;
  }
  std::clearerr(file);
  return true;
}

// Returns 0 or the errno of the failed open/read.
int read_path(const std::string& path, std::string& out) {
  errno = 0;
  FilePtr file(std::fopen(path.c_str(), "r"));
  if (file == nullptr) {
    return errno != 0 ? errno : EIO;
  }
  if (!read_stream(file.get(), out)) {
    return errno != 0 ? errno : EIO;
  }
  return 0;
}

bool parse_u64(const char*& cursor, std::uint64_t& value) noexcept {
  while (*cursor == ' ' || *cursor == '\t') {
    ++cursor;
  }
  if (std::isdigit(static_cast<unsigned char>(*cursor)) == 0 && *cursor != '-') {
    return false;
  }

  char* end = nullptr;
  errno = 0;
  const unsigned long long parsed = std::strtoull(cursor, &end, 10);
  if (errno != 0 || end == cursor) {
    return false;
  }
  value = parsed;
  cursor = end;
  return true;
}

// Matches "key: value", "key value" and "key:   value kB" lines.
bool find_keyed_value(const std::string& text, const std::string_view key, std::uint64_t& value) noexcept {
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }

    const std::string_view line(text.data() + line_start, line_end - line_start);
    if (line.size() > key.size() && line.compare(0, key.size(), key) == 0) {
      const char separator = line[key.size()];
      if (separator == ':' || separator == ' ' || separator == '\t') {
        const char* cursor = text.c_str() + line_start + key.size() + (separator == ':' ? 1 : 0);
        return parse_u64(cursor, value);
      }
    }
    line_start = line_end + 1;
  }
  return false;
}

bool parse_process_stat(const std::string& text, ProcessStat& out) {
  const auto open_paren = text.find('(');
  const auto close_paren = text.rfind(')');
  if (open_paren == std::string::npos || close_paren == std::string::npos || close_paren < open_paren) {
    return false;
  }

  const char* cursor = text.c_str();
  std::uint64_t pid = 0;
  if (!parse_u64(cursor, pid)) {
    return false;
  }
  out.pid = static_cast<std::int64_t>(pid);
  out.name = text.substr(open_paren + 1, close_paren - open_paren - 1);

  // The comm field may contain spaces and parentheses; fields restart after the last ')'.
  cursor = text.c_str() + close_paren + 1;
  while (*cursor == ' ') {
    ++cursor;
  }
  if (*cursor == '\0') {
    return false;
  }
  ++cursor;  // state

  std::array<std::uint64_t, kProcessStatFieldCount> fields{};
  for (std::uint64_t& field : fields) {
    if (!parse_u64(cursor, field)) {
      return false;
    }
  }

  out.minflt = fields[6];
  out.majflt = fields[8];
  out.utime = fields[10];
  out.stime = fields[11];
  out.num_threads = fields[16];
  out.starttime = fields[18];
  out.vsize = fields[19];
  out.rss = fields[20];
  return true;
}

bool parse_cpu_line(const std::string& text, const std::string_view label, CpuTimes& out) noexcept {
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }

    const std::string_view line(text.data() + line_start, line_end - line_start);
    if (line.size() > label.size() && line.compare(0, label.size(), label) == 0 && line[label.size()] == ' ') {
      const char* cursor = text.c_str() + line_start + label.size();
      std::uint64_t values[8]{};
      std::size_t parsed = 0;
      for (; parsed < 8; ++parsed) {
        if (cursor >= text.c_str() + line_end || !parse_u64(cursor, values[parsed])) {
          break;
        }
      }
      if (parsed < 4) {
        return false;
      }

      out = CpuTimes{values[0], values[1], values[2], values[3], values[4], values[5], values[6], values[7]};
      return true;
    }
    line_start = line_end + 1;
  }
  return false;
}

std::vector<std::string> list_cpu_indices(const std::string& text) {
  std::vector<std::string> indices;
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }

    const std::string_view line(text.data() + line_start, line_end - line_start);
    if (line.rfind("cpu", 0) == 0) {
      const auto space = line.find(' ');
      const std::string_view index = line.substr(3, space == std::string_view::npos ? line.size() - 3 : space - 3);
      if (is_all_digits(index)) {
        indices.emplace_back(index);
      }
    }
    line_start = line_end + 1;
  }
  return indices;
}

std::vector<NetDevRow> parse_net_dev(const std::string& text) {
  std::vector<NetDevRow> rows;
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    std::size_t line_end = text.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = text.size();
    }

    const std::string_view line(text.data() + line_start, line_end - line_start);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      const char* cursor = text.c_str() + line_start + colon + 1;
      std::uint64_t values[10]{};
      bool ok = true;
      for (std::uint64_t& value : values) {
        if (!parse_u64(cursor, value)) {
          ok = false;
          break;
        }
      }
      if (ok) {
        rows.push_back(NetDevRow{core::trim(line.substr(0, colon)), values[0], values[1], values[8], values[9]});
      }
    }
    line_start = line_end + 1;
  }
  return rows;
}

std::string process_file(const std::string& root, const std::int64_t pid, const char* name) {
  return root + "/" + std::to_string(pid) + "/" + name;
}

std::vector<std::int64_t> list_process_ids(const std::string& root) {
  std::vector<std::int64_t> pids;
  std::error_code ec;
  std::filesystem::directory_iterator it(root, ec);
  for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (!is_all_digits(name)) {
      continue;
    }
    pids.push_back(static_cast<std::int64_t>(std::strtoll(name.c_str(), nullptr, 10)));
  }
  std::sort(pids.begin(), pids.end());
  return pids;
}

std::vector<ProcfsProvider::ProcessEntry> enumerate_processes(const std::string& root) {
  std::vector<ProcfsProvider::ProcessEntry> instances;
  std::unordered_map<std::string, int> seen;
  std::string text;
  for (const std::int64_t pid : list_process_ids(root)) {
    ProcessStat stat{};
    if (read_path(process_file(root, pid, "stat"), text) != 0 || !parse_process_stat(text, stat)) {
      continue;
    }

    const int ordinal = seen[stat.name]++;
    instances.push_back(ProcfsProvider::ProcessEntry{
        ordinal == 0 ? stat.name : stat.name + "#" + std::to_string(ordinal), pid, stat.starttime});
  }
  return instances;
}

const char* source_file(const Source source) noexcept {
  switch (source) {
    case Source::cpu_stat:
    case Source::system_stat:
      return "stat";
    case Source::meminfo:
      return "meminfo";
    case Source::vmstat:
      return "vmstat";
    case Source::uptime:
      return "uptime";
    case Source::net_dev:
      return "net/dev";
    case Source::process_stat:
    case Source::process_io:
    case Source::process_fd:
    case Source::process_count:
      return nullptr;
  }
  return nullptr;
}

[[noreturn]] void throw_open_error(const int error, const std::string& what) {
  if (error == EACCES || error == EPERM) {
    throw core::CounterError(core::errc::access_denied, what);
  }
  throw core::CounterError(std::error_code(error, std::system_category()), what);
}

[[noreturn]] void throw_process_read_error(const int error, const std::string& what) {
  if (error == ENOENT || error == ESRCH) {
    throw core::CounterError(core::errc::instance_exited, what);
  }
  if (error == EACCES || error == EPERM) {
    throw core::CounterError(core::errc::access_denied, what);
  }
  throw core::CounterError(core::errc::read_failed, what + ": " + std::strerror(error));
}

class ProcfsCounterHandle final : public CounterHandle {
 public:
  ProcfsCounterHandle(const CounterDefinition& definition, Binding binding, std::string proc_root,
                      ProcfsProvider::Clock clock, FilePtr file)
      : definition_(definition),
        binding_(std::move(binding)),
        proc_root_(std::move(proc_root)),
        clock_(std::move(clock)),
        file_(std::move(file)) {}

  ~ProcfsCounterHandle() override { close(); }

  ProcfsCounterHandle(const ProcfsCounterHandle&) = delete;
  ProcfsCounterHandle& operator=(const ProcfsCounterHandle&) = delete;

  RawSample next_sample() override {
    if (!open_) {
      throw core::CounterError(core::errc::handle_closed, describe());
    }

    const std::int64_t now = clock_();
    RawSample sample{};
    sample.timestamp = now;
    sample.counter_type = definition_.type;
    sample.system_frequency = is_time_based(definition_.type) ? core::kMonotonicFrequency : 0;
    read_value(now, sample.raw_value, sample.base_value);
    return sample;
  }

  void close() noexcept override {
    file_.reset();
    open_ = false;
  }

  [[nodiscard]] bool is_open() const noexcept override { return open_; }

 private:
  std::string describe() const {
    return std::string(definition_.category) + "\\" + definition_.counter + "(" + binding_.instance + ")";
  }

  void read_value(const std::int64_t now, std::int64_t& raw, std::int64_t& base) {
    base = 0;
    switch (definition_.source) {
      case Source::process_stat:
        if (definition_.field == Field::process_id && !binding_.total) {
          raw = binding_.pid;
          return;
        }
        raw = process_stat_value(binding_.total ? sum_process_stats() : bound_process_stat());
        return;
      case Source::process_io:
        raw = process_io_value();
        return;
      case Source::process_fd:
        raw = process_fd_count();
        return;
      case Source::cpu_stat:
        cpu_value(raw, base);
        return;
      case Source::system_stat:
        raw = keyed_value(definition_.field == Field::context_switches ? "ctxt" : "procs_running");
        return;
      case Source::meminfo:
        meminfo_value(raw, base);
        return;
      case Source::vmstat:
        raw = keyed_value("pgfault");
        return;
      case Source::uptime:
        raw = now - uptime_ticks();
        return;
      case Source::process_count:
        raw = static_cast<std::int64_t>(list_process_ids(proc_root_).size());
        return;
      case Source::net_dev:
        raw = net_dev_value();
        return;
    }
    throw core::CounterError(core::errc::read_failed, describe());
  }

  const std::string& read_source() {
    if (!read_stream(file_.get(), buffer_)) {
      throw core::CounterError(core::errc::read_failed, describe() + ": " + std::strerror(errno));
    }
    return buffer_;
  }

  std::int64_t keyed_value(const std::string_view key) {
    std::uint64_t value = 0;
    if (!find_keyed_value(read_source(), key, value)) {
      throw core::CounterError(core::errc::parse_error, describe() + ": missing " + std::string(key));
    }
    return static_cast<std::int64_t>(value);
  }

  ProcessStat bound_process_stat() {
    const std::string path = process_file(proc_root_, binding_.pid, "stat");
    const int error = read_path(path, buffer_);
    if (error != 0) {
      throw_process_read_error(error, describe());
    }

    ProcessStat stat{};
    if (!parse_process_stat(buffer_, stat)) {
      throw core::CounterError(core::errc::parse_error, path);
    }
    if (stat.starttime != binding_.starttime) {
      throw core::CounterError(core::errc::instance_exited, describe() + ": pid " + std::to_string(binding_.pid) +
                                                                 " belongs to another process");
    }
    return stat;
  }

  ProcessStat sum_process_stats() {
    ProcessStat total{};
    for (const std::int64_t pid : list_process_ids(proc_root_)) {
      ProcessStat stat{};
      if (read_path(process_file(proc_root_, pid, "stat"), buffer_) != 0 || !parse_process_stat(buffer_, stat)) {
        continue;
      }
      total.minflt += stat.minflt;
      total.majflt += stat.majflt;
      total.utime += stat.utime;
      total.stime += stat.stime;
      total.num_threads += stat.num_threads;
      total.vsize += stat.vsize;
      total.rss += stat.rss;
    }
    return total;
  }

  std::int64_t process_stat_value(const ProcessStat& stat) const {
    switch (definition_.field) {
      case Field::process_id:
        return stat.pid;
      case Field::process_cpu:
        return static_cast<std::int64_t>(stat.utime + stat.stime) * clock_tick_ns();
      case Field::process_user:
        return static_cast<std::int64_t>(stat.utime) * clock_tick_ns();
      case Field::process_privileged:
        return static_cast<std::int64_t>(stat.stime) * clock_tick_ns();
      case Field::thread_count:
        return static_cast<std::int64_t>(stat.num_threads);
      case Field::working_set:
        return static_cast<std::int64_t>(stat.rss) * page_size_bytes();
      case Field::virtual_bytes:
        return static_cast<std::int64_t>(stat.vsize);
      case Field::process_page_faults:
        return static_cast<std::int64_t>(stat.minflt + stat.majflt);
      case Field::process_elapsed:
        return static_cast<std::int64_t>(stat.starttime) * clock_tick_ns();
      default:
        throw core::CounterError(core::errc::read_failed, describe());
    }
  }

  std::int64_t process_io_value() {
    const std::string_view key = definition_.field == Field::io_read_bytes ? "rchar" : "wchar";
    if (binding_.total) {
      std::uint64_t total = 0;
      for (const std::int64_t pid : list_process_ids(proc_root_)) {
        std::uint64_t value = 0;
        if (read_path(process_file(proc_root_, pid, "io"), buffer_) == 0 && find_keyed_value(buffer_, key, value)) {
          total += value;
        }
      }
      return static_cast<std::int64_t>(total);
    }

    (void)bound_process_stat();
    const int error = read_path(process_file(proc_root_, binding_.pid, "io"), buffer_);
    if (error != 0) {
      throw_process_read_error(error, describe());
    }
    std::uint64_t value = 0;
    if (!find_keyed_value(buffer_, key, value)) {
      throw core::CounterError(core::errc::parse_error, describe() + ": missing " + std::string(key));
    }
    return static_cast<std::int64_t>(value);
  }

  std::int64_t count_fds(const std::int64_t pid, std::error_code& ec) const {
    std::int64_t count = 0;
    std::filesystem::directory_iterator it(process_file(proc_root_, pid, "fd"), ec);
    for (const std::filesystem::directory_iterator end{}; !ec && it != end; it.increment(ec)) {
      ++count;
    }
    return count;
  }

  std::int64_t process_fd_count() {
    std::error_code ec;
    if (binding_.total) {
      std::int64_t total = 0;
      for (const std::int64_t pid : list_process_ids(proc_root_)) {
        const std::int64_t count = count_fds(pid, ec);
        if (!ec) {
          total += count;
        }
        ec.clear();
      }
      return total;
    }

    (void)bound_process_stat();
    const std::int64_t count = count_fds(binding_.pid, ec);
    if (ec) {
      throw_process_read_error(ec.value(), describe());
    }
    return count;
  }

  void cpu_value(std::int64_t& raw, std::int64_t& base) {
    CpuTimes times{};
    if (!parse_cpu_line(read_source(), binding_.key, times)) {
      if (binding_.total) {
        throw core::CounterError(core::errc::parse_error, describe());
      }
      throw core::CounterError(core::errc::instance_exited, describe());
    }

    base = static_cast<std::int64_t>(times.total());
    switch (definition_.field) {
      case Field::cpu_busy:
        raw = static_cast<std::int64_t>(times.busy());
        return;
      case Field::cpu_idle:
        raw = static_cast<std::int64_t>(times.idle_total());
        return;
      case Field::cpu_user:
        raw = static_cast<std::int64_t>(times.user + times.nice);
        return;
      case Field::cpu_privileged:
        raw = static_cast<std::int64_t>(times.system);
        return;
      case Field::cpu_interrupt:
        raw = static_cast<std::int64_t>(times.irq + times.softirq);
        return;
      default:
        throw core::CounterError(core::errc::read_failed, describe());
    }
  }

  void meminfo_value(std::int64_t& raw, std::int64_t& base) {
    const std::string& text = read_source();
    auto kb = [this, &text](const std::string_view key) {
      std::uint64_t value = 0;
      if (!find_keyed_value(text, key, value)) {
        throw core::CounterError(core::errc::parse_error, describe() + ": missing " + std::string(key));
      }
      return static_cast<std::int64_t>(value);
    };

    switch (definition_.field) {
      case Field::available_bytes:
        raw = kb("MemAvailable") * 1024;
        return;
      case Field::available_mbytes:
        raw = kb("MemAvailable") / 1024;
        return;
      case Field::committed_bytes:
        raw = kb("Committed_AS") * 1024;
        return;
      case Field::commit_limit:
        raw = kb("CommitLimit") * 1024;
        return;
      case Field::committed_in_use:
        raw = kb("Committed_AS");
        base = kb("CommitLimit");
        return;
      default:
        throw core::CounterError(core::errc::read_failed, describe());
    }
  }

  std::int64_t uptime_ticks() {
    const std::string& text = read_source();
    char* end = nullptr;
    errno = 0;
    const double seconds = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str()) {
      throw core::CounterError(core::errc::parse_error, describe());
    }
    return static_cast<std::int64_t>(seconds * static_cast<double>(core::kMonotonicFrequency));
  }

  std::int64_t net_dev_value() {
    const std::vector<NetDevRow> rows = parse_net_dev(read_source());
    NetDevRow selected{};
    bool found = binding_.total;
    for (const NetDevRow& row : rows) {
      if (binding_.total) {
        selected.rx_bytes += row.rx_bytes;
        selected.rx_packets += row.rx_packets;
        selected.tx_bytes += row.tx_bytes;
        selected.tx_packets += row.tx_packets;
      } else if (row.name == binding_.key) {
        selected = row;
        found = true;
        break;
      }
    }
    if (!found) {
      throw core::CounterError(core::errc::instance_exited, describe());
    }

    switch (definition_.field) {
      case Field::rx_bytes:
        return static_cast<std::int64_t>(selected.rx_bytes);
      case Field::tx_bytes:
        return static_cast<std::int64_t>(selected.tx_bytes);
      case Field::total_bytes:
        return static_cast<std::int64_t>(selected.rx_bytes + selected.tx_bytes);
      case Field::rx_packets:
        return static_cast<std::int64_t>(selected.rx_packets);
      case Field::tx_packets:
        return static_cast<std::int64_t>(selected.tx_packets);
      default:
        throw core::CounterError(core::errc::read_failed, describe());
    }
  }

  const CounterDefinition& definition_;
  Binding binding_;
  std::string proc_root_;
  ProcfsProvider::Clock clock_;
  FilePtr file_;
  bool open_{true};
  std::string buffer_{};
};

const CategoryDefinition* find_category(const std::string& name) noexcept {
  for (const CategoryDefinition& category : kCategories) {
    if (core::iequals(category.name, name)) {
      return &category;
    }
  }
  return nullptr;
}

const CounterDefinition* find_counter(const CategoryDefinition& category, const std::string& name) noexcept {
  for (const CounterDefinition& counter : kCatalogue) {
    if (std::strcmp(counter.category, category.name) == 0 && core::iequals(counter.counter, name)) {
      return &counter;
    }
  }
  return nullptr;
}

std::string read_required(const std::string& root, const char* name) {
  std::string text;
  const std::string path = root + "/" + name;
  const int error = read_path(path, text);
  if (error != 0) {
    throw_open_error(error, path);
  }
  return text;
}

}  // namespace

ProcfsProvider::ProcfsProvider() : ProcfsProvider("/proc") {}

ProcfsProvider::ProcfsProvider(std::string proc_root, Clock clock)
    : proc_root_(std::move(proc_root)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = core::monotonic_ticks_now;
  }

  char host_name[256]{};
  if (::gethostname(host_name, sizeof(host_name) - 1) == 0) {
    host_name_ = host_name;
  }
}

std::unique_ptr<CounterHandle> ProcfsProvider::open(const CounterPath& path, const bool read_only) {
  if (!read_only) {
    throw core::CounterError(core::errc::access_denied, "procfs counters are read-only: " + path.counter);
  }
  if (!path.machine_name.empty() && !is_local_machine(path.machine_name)) {
    throw core::CounterError(core::errc::machine_unreachable, path.machine_name);
  }

  const CategoryDefinition* category = find_category(path.category);
  if (category == nullptr) {
    throw core::CounterError(core::errc::category_not_found, path.category);
  }
  const CounterDefinition* definition = find_counter(*category, path.counter);
  if (definition == nullptr) {
    throw core::CounterError(core::errc::counter_not_found, path.category + "\\" + path.counter);
  }

  Binding binding{};
  binding.instance = path.instance;
  if (!category->multi_instance) {
    if (!path.instance.empty()) {
      throw core::CounterError(core::errc::single_instance_category, path.category + "(" + path.instance + ")");
    }
  } else if (path.instance.empty() || core::iequals(path.instance, kTotalInstance)) {
    binding.total = true;
    binding.instance = kTotalInstance;
    binding.key = definition->source == Source::cpu_stat ? "cpu" : "";
  } else if (definition->source == Source::cpu_stat) {
    CpuTimes times{};
    if (!is_all_digits(path.instance) ||
        !parse_cpu_line(read_required(proc_root_, "stat"), "cpu" + path.instance, times)) {
      throw core::CounterError(core::errc::instance_not_found, path.category + "(" + path.instance + ")");
    }
    binding.key = "cpu" + path.instance;
  } else if (definition->source == Source::net_dev) {
    const auto rows = parse_net_dev(read_required(proc_root_, "net/dev"));
    const bool exists =
        std::any_of(rows.begin(), rows.end(), [&path](const NetDevRow& row) { return row.name == path.instance; });
    if (!exists) {
      throw core::CounterError(core::errc::instance_not_found, path.category + "(" + path.instance + ")");
    }
    binding.key = path.instance;
  } else {
    const ProcessEntry* process = find_process(path.instance);
    if (process == nullptr) {
      throw core::CounterError(core::errc::instance_not_found, path.category + "(" + path.instance + ")");
    }
    binding.pid = process->pid;
    binding.starttime = process->starttime;
  }

  FilePtr file{};
  if (const char* name = source_file(definition->source); name != nullptr) {
    const std::string file_path = proc_root_ + "/" + name;
    errno = 0;
    file.reset(std::fopen(file_path.c_str(), "r"));
    if (file == nullptr) {
      throw_open_error(errno != 0 ? errno : EIO, file_path);
    }
  }

  if (core::log_enabled(core::LogLevel::debug)) {
    core::log(core::LogLevel::debug, kLogTag,
              std::string("opened ") + definition->category + "\\" + definition->counter + "(" + binding.instance +
                  ")" + (binding.pid != 0 ? " pid=" + std::to_string(binding.pid) : std::string{}));
  }

  return std::make_unique<ProcfsCounterHandle>(*definition, std::move(binding), proc_root_, clock_, std::move(file));
}

std::vector<std::string> ProcfsProvider::instance_names(const std::string& category) {
  const CategoryDefinition* definition = find_category(category);
  if (definition == nullptr) {
    throw core::CounterError(core::errc::category_not_found, category);
  }

  std::vector<std::string> names;
  if (!definition->multi_instance) {
    return names;
  }

  if (std::strcmp(definition->name, "Process") == 0) {
    for (const ProcessEntry& process : refresh_process_listing()) {
      names.push_back(process.name);
    }
  } else if (std::strcmp(definition->name, "Processor") == 0) {
    names = list_cpu_indices(read_required(proc_root_, "stat"));
  } else {
    for (const NetDevRow& row : parse_net_dev(read_required(proc_root_, "net/dev"))) {
      names.push_back(row.name);
    }
  }
  names.emplace_back(kTotalInstance);
  return names;
}

std::vector<std::string> ProcfsProvider::category_names() const {
  std::vector<std::string> names;
  for (const CategoryDefinition& category : kCategories) {
    names.emplace_back(category.name);
  }
  return names;
}

std::vector<std::string> ProcfsProvider::counter_names(const std::string& category) const {
  const CategoryDefinition* definition = find_category(category);
  if (definition == nullptr) {
    throw core::CounterError(core::errc::category_not_found, category);
  }

  std::vector<std::string> names;
  for (const CounterDefinition& counter : kCatalogue) {
    if (std::strcmp(counter.category, definition->name) == 0) {
      names.emplace_back(counter.counter);
    }
  }
  return names;
}

const std::vector<ProcfsProvider::ProcessEntry>& ProcfsProvider::refresh_process_listing() {
  process_listing_ = enumerate_processes(proc_root_);
  process_listing_taken_ = clock_();
  has_process_listing_ = true;
  return process_listing_;
}

const ProcfsProvider::ProcessEntry* ProcfsProvider::find_process(const std::string& instance) {
  const auto lookup = [this, &instance]() -> const ProcessEntry* {
    const auto it = std::find_if(process_listing_.begin(), process_listing_.end(),
                                 [&instance](const ProcessEntry& process) { return process.name == instance; });
    return it == process_listing_.end() ? nullptr : &*it;
  };

  const std::int64_t age = clock_() - process_listing_taken_;
  if (has_process_listing_ && age >= 0 && age <= kProcessListingTtl) {
    if (const ProcessEntry* process = lookup(); process != nullptr) {
      return process;
    }
  }

  // Unknown or stale names are looked up in a fresh listing.
  refresh_process_listing();
  return lookup();
}

const std::string& ProcfsProvider::proc_root() const noexcept { return proc_root_; }

bool ProcfsProvider::is_local_machine(const std::string& machine_name) const {
  return machine_name == "." || core::iequals(machine_name, "localhost") ||
         (!host_name_.empty() && core::iequals(machine_name, host_name_));
}

}  // namespace perf_sampler::counters
