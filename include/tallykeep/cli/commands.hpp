#pragma once

namespace tallykeep::cli {

int run_cli(int argc, char **argv);

} // namespace tallykeep::cli
