#include "tallykeep/cli/commands.hpp"

int main(int argc, char **argv) { return tallykeep::cli::run_cli(argc, argv); }
