#pragma once

namespace julesbot::cli {

/// julesbot [--config PATH] [run | check-config | version | help]
[[nodiscard]] int run_cli(int argc, char **argv);

} // namespace julesbot::cli
