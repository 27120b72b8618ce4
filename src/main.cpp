#include "julesbot/cli/commands.hpp"

int main(int argc, char **argv) { return julesbot::cli::run_cli(argc, argv); }
