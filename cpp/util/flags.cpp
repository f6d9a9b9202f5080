#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::interpreter = "python3";
uint32_t Flags::max_memory_mb = 128;
uint32_t Flags::max_cpu_seconds = 10;
uint32_t Flags::max_concurrent = 10;
bool Flags::no_isolation = false;
std::string Flags::temp_directory;
uint32_t Flags::max_files = 64;
uint32_t Flags::max_output_kb = 10240;

bool Flags::daemon = false;
std::string Flags::pidfile;
std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 8000;

uint32_t Flags::timeout = 5;
