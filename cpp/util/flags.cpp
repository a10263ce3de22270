#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;
std::string Flags::interpreter;
int64_t Flags::timeout_millis = 1000;
int64_t Flags::drain_grace_millis = 500;
std::string Flags::workspace_directory;
std::string Flags::workspace_extension = ".قتام";  // NOLINT
bool Flags::override_builtins = false;
std::string Flags::disabled_builtins;
std::string Flags::disabled_flag;
std::string Flags::separator;
int64_t Flags::max_output_bytes = 1024 * 1024;

std::string Flags::listen_address = "localhost";
int64_t Flags::port = 3000;
std::string Flags::static_directory;
int64_t Flags::max_request_bytes = 1024 * 1024;
