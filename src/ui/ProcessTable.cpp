#include "ui/ProcessTable.hpp"
#include "ui/Formatting.hpp"
#include "util/ProcParse.hpp"

namespace procsnap::ui {

namespace {
constexpr int kPidW = 10;
constexpr int kOwnerW = 15;
constexpr int kCmdW = 15;
constexpr int kExeW = 30;
constexpr int kStartW = 20;
constexpr int kStateW = 15;

std::string join_columns(const std::string& pid, const std::string& owner, const std::string& cmd,
                         const std::string& exe, const std::string& start, const std::string& state) {
  std::string line;
  line += pad_right(pid, kPidW); line += ' ';
  line += pad_right(owner, kOwnerW); line += ' ';
  line += pad_right(cmd, kCmdW); line += ' ';
  line += pad_right(exe, kExeW); line += ' ';
  line += pad_right(start, kStartW); line += ' ';
  line += pad_right(state, kStateW);
  while (!line.empty() && line.back() == ' ') line.pop_back();
  return line;
}

std::string or_placeholder(const std::optional<std::string>& v, const std::string& placeholder) {
  if (!v) return placeholder;
  auto shown = printable(*v);
  return shown.empty() ? placeholder : shown;
}
} // namespace

std::string render_header() {
  return join_columns("PID", "Owner", "Cmdline", "Binary Path", "Start Time", "State");
}

std::string render_row(const procsnap::model::ProcessRecord& rec, const TableStyle& style) {
  std::string start = style.time_placeholder;
  if (rec.start_time) {
    auto formatted = procsnap::util::format_local_time(*rec.start_time);
    if (!formatted.empty()) start = std::move(formatted);
  }
  return join_columns(std::to_string(rec.pid),
                      or_placeholder(rec.owner, style.placeholder),
                      or_placeholder(rec.command_line, style.placeholder),
                      or_placeholder(rec.executable_path, style.placeholder),
                      start,
                      or_placeholder(rec.state, style.placeholder));
}

std::vector<std::string> render_process_table(
    const procsnap::model::ProcessTable& table,
    const TableStyle& style,
    bool header
) {
  std::vector<std::string> lines;
  lines.reserve(table.records.size() + 1);
  if (header) lines.push_back(render_header());
  for (const auto& rec : table.records) lines.push_back(render_row(rec, style));
  return lines;
}

} // namespace procsnap::ui
