#pragma once

#include "model/Process.hpp"
#include <string>
#include <vector>

namespace procsnap::ui {

struct TableStyle {
  std::string placeholder{"-"};
  std::string time_placeholder{"unknown"};
};

// Column titles: PID, Owner, Cmdline, Binary Path, Start Time, State
std::string render_header();

// One fixed-width line per record, without trailing newline
std::string render_row(const procsnap::model::ProcessRecord& rec, const TableStyle& style);

std::vector<std::string> render_process_table(
    const procsnap::model::ProcessTable& table,
    const TableStyle& style,
    bool header
);

} // namespace procsnap::ui
