#pragma once

namespace mo {

void print_cli_help();

} // namespace mo
