#pragma once
/*
 * FileReader
 *
 * Purpose: read a document via mmap and split it into lines; normalize CRLF.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * list_directory() gives the directory view shown for folder panes.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);

bool list_directory(const std::filesystem::path& path,
                    std::vector<std::string>& out_entries,
                    std::string& msg);
