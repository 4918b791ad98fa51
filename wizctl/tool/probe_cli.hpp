#pragma once

#include "wizctl/tool/probe_config.hpp"

namespace wizctl
{

/**
 * Parses the wizctl_probe command line.
 * Prints usage and exits on --help.
 * @throws boost::program_options::error on invalid or inconsistent options
 */
ProbeConfig parse_command_line(int argc, char* argv[]);

} // namespace wizctl
