#ifndef LOGGING_HPP
#define LOGGING_HPP

#include <string>

// Installs the default spdlog logger: colored stderr, plus a rotating file
// when log_file is non-empty. verbose lowers the console level to debug.
void init_logging(bool verbose, const std::string &log_file);

#endif
