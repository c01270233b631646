#include "util/flags.hpp"

std::string Flags::log_file;
bool Flags::verbose = false;

std::string Flags::temp_directory = "/tmp";
std::string Flags::interpreter = "python3";
std::string Flags::wrapper = "sandbox-runner.py";
std::string Flags::source_name = "kata.py";
int32_t Flags::timeout_millis = 10000;
int32_t Flags::timeout_grace_millis = 500;
int32_t Flags::stop_grace_millis = 3000;
std::string Flags::foreground_args = "-u";

std::vector<std::string> Flags::assets;
std::string Flags::image_output;
bool Flags::run_foreground = false;
bool Flags::stop = false;

std::string Flags::listen_address = "127.0.0.1";
int32_t Flags::port = 7070;

std::string Flags::server = "127.0.0.1";
