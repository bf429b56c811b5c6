#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tb::utils
{

// Directory holding the log file, the history database and the registry
// snapshot. Defaults to "data" beside the executable until overridden.
std::filesystem::path data_root();
void set_data_root(std::filesystem::path root);
std::optional<std::filesystem::path> executable_path();

// Writes to "<path>.tmp" and renames over the target so readers never see a
// partially written file.
bool write_file_atomic(std::filesystem::path const &path,
                       std::string_view content);
std::optional<std::vector<std::uint8_t>>
read_file_bytes(std::filesystem::path const &path);
std::optional<std::string> read_file_text(std::filesystem::path const &path);

} // namespace tb::utils
