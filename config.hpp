#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <chrono>
#include <cstddef>

constexpr int SSH_DEFAULT_PORT = 22;
constexpr int CONNECT_TIMEOUT_MS = 10000;
constexpr int DETECT_TIMEOUT_MS = 15000;
constexpr int SURVEY_TIMEOUT_MS = 15000;
constexpr int SCAN_TIMEOUT_MS = 60000;

constexpr int KEEPALIVE_INTERVAL_S = 30;
constexpr int KEEPALIVE_MAX_FAILURES = 3;

constexpr const char *LEGACY_HOSTKEY_ALGORITHMS = "ssh-rsa";

constexpr int BUFFER_SIZE = 16384;
constexpr int LISTEN_BACKLOG = 128;
constexpr int POLL_INTERVAL_MS = 100;
constexpr int SPLICE_POLL_MS = 20;

constexpr int ACCEPT_BACKOFF_MS = 50;
constexpr int MAX_ACCEPT_ERRORS = 10;
constexpr int DRAIN_TIMEOUT_MS = 5000;

constexpr int BUILD_PACING_MS = 50;

constexpr int PORT_PROBE_WINDOW = 256;
constexpr int MAX_PORT = 65535;

#endif
