#include "app/Config.hpp"
#include "collectors/HostQueries.hpp"
#include "collectors/ProcessCollector.hpp"
#include "model/Process.hpp"
#include "ui/ProcessTable.hpp"

#include <cstdio>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  procsnap::app::CliOptions opts;
  std::string err;
  switch (procsnap::app::parse_args(argc, argv, opts, err)) {
    case procsnap::app::ParseResult::Help:
      std::cout << procsnap::app::usage();
      return 0;
    case procsnap::app::ParseResult::Error:
      std::fprintf(stderr, "procsnap: %s\n%s", err.c_str(), procsnap::app::usage());
      return 2;
    case procsnap::app::ParseResult::Ok:
      break;
  }

  auto cfg = procsnap::app::resolve_config(opts);

  procsnap::collectors::SystemHostQueries host;
  procsnap::collectors::ProcessCollector collector(cfg.proc_root, host, cfg.diagnostics);
  procsnap::model::ProcessTable table;
  if (!collector.enumerate(table)) {
    std::fprintf(stderr, "procsnap: %s\n", procsnap::collectors::describe(collector.last_error()).c_str());
    return 1;
  }

  procsnap::ui::TableStyle style{cfg.placeholder, cfg.time_placeholder};
  for (const auto& line : procsnap::ui::render_process_table(table, style, cfg.header)) {
    std::cout << line << '\n';
  }
  std::cout.flush();
  return std::cout ? 0 : 1;
}
