#pragma once
/*
 * FileReader
 *
 * Purpose: read the rc file via mmap and split into lines; normalize CRLF, drop a UTF-8 BOM.
 * Usage: mmap_readlines(path, out_lines, msg); returns false with msg on failure.
 * Note: files over 1 MiB are refused.
 */
#include <vector>
#include <string>
#include <filesystem>

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
