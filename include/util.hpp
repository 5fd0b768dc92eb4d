#pragma once
#include <string>
#include <vector>
#include <filesystem>

std::string getenv_or(const char* key, const std::string& def);
int getenv_int_or(const char* key, int def);
double getenv_double_or(const char* key, double def);

std::string read_text_file(const std::filesystem::path& p);
std::string read_binary_file(const std::filesystem::path& p);
// Writes to <p>.tmp and renames over p, so readers see either the old or the new file.
void write_file_atomic(const std::filesystem::path& p, const std::string& bytes);

std::string sha256_hex(const std::string& bytes);

std::string trim(const std::string& s);
bool is_blank(const std::string& s);
bool is_valid_utf8(const std::string& s);
// First n bytes with "..." appended when cut; for log lines.
std::string truncate_for_log(const std::string& s, std::size_t n = 50);
