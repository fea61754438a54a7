#pragma once
/*
 * FileReader
 *
 * Purpose: read a whole file via mmap, either raw (note bytes) or split into
 *          lines with CRLF normalized (rc file).
 * Usage: mmap_read_bytes(path, out, msg); returns false with msg on failure.
 *        A missing file is a failure; an empty file yields no bytes / one empty line.
 */
#include <cstdint>
#include <vector>
#include <string>
#include <filesystem>

bool mmap_read_bytes(const std::filesystem::path& path,
                     std::vector<std::uint8_t>& out,
                     std::string& msg);

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg);
