#pragma once

#include "conf/errors.hpp"
#include "conf/line_parser.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rmqconf {

// In-memory rabbitmq.conf (Cuttlefish format) that round-trips losslessly:
// comments, blank lines and the order of untouched settings are kept as read.
//
// Lines are held in file order next to a key -> line index. Both are private
// and every mutation updates them together. On duplicate keys the index
// points at the last occurrence; earlier ones stay in the file untouched.
class ConfDocument {
public:
    ConfDocument() = default;

    // Parse configuration text. The first bad line fails the whole parse.
    static std::expected<ConfDocument, ConfError> parse(std::string_view content);

    // Read and parse a file. I/O failures carry the filesystem's error code.
    static std::expected<ConfDocument, ConfError> load(const std::filesystem::path& path);

    // Write to_text() to `path` (temporary file + rename). A symlinked path
    // updates the file it points to; an existing file keeps its permissions.
    std::expected<void, ConfError> save(const std::filesystem::path& path) const;

    std::optional<std::string> get(std::string_view key) const;

    // Typed reads, nullopt when absent or not parseable as the type
    std::optional<int64_t> get_int(std::string_view key) const;
    std::optional<bool> get_bool(std::string_view key) const;
    std::optional<double> get_float(std::string_view key) const;

    bool contains_key(std::string_view key) const;

    // Replace the setting in place, or append it at the end when absent
    void set(std::string_view key, std::string_view value);

    // Blank out the setting's line (line count is unchanged)
    bool remove(std::string_view key);

    // Mapped keys in alphabetical order
    std::vector<std::string> keys() const;

    // (key, value) for every key matching `pattern`, alphabetical by key
    std::vector<std::pair<std::string, std::string>> get_matching(std::string_view pattern) const;

    static bool is_pattern(std::string_view key);

    // Render in file order, every line newline-terminated
    std::string to_text() const;

    size_t line_count() const { return lines_.size(); }
    bool empty() const { return key_index_.empty(); }

private:
    const Setting* setting_at(size_t index) const;

    std::vector<Line> lines_;
    std::map<std::string, size_t, std::less<>> key_index_;
};

} // namespace rmqconf
