#pragma once

namespace warden::cli {

int run_cli(int argc, char **argv);

} // namespace warden::cli
