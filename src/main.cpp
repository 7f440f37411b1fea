#include "mcpbridge/cli/commands.hpp"

int main(int argc, char **argv) { return mcpbridge::cli::run_cli(argc, argv); }
