#ifndef DETECTOR_HPP
#define DETECTOR_HPP

#include <memory>
#include <string>
#include "gateway.hpp"

// Picks the vendor dialect, first match wins:
//   1. SSH banner mentions ROSSSH or MikroTik
//   2. "/system identity print" answers
//   3. /etc/version or uname -a mentions EdgeOS, ubnt or Ubiquiti
//   4. Ubiquiti, since its Linux commands are the more portable guess
std::unique_ptr<Gateway> detect_gateway(const std::string &banner, CommandRunner run,
                                        const CancellationScope &cancel);

#endif
