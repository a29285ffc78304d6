#include "conf/document.hpp"
#include "conf/pattern.hpp"
#include "conf/value_format.hpp"
#include "common/log.hpp"

#include <cerrno>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

namespace rmqconf {

namespace {

const log::Logger& logger() {
    static const log::Logger instance(log::CONF_LOGGER);
    return instance;
}

// Lines of text: '\n' separated, "\r\n" accepted, no phantom line after a
// trailing newline
std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        size_t end = nl == std::string_view::npos ? content.size() : nl;
        std::string_view line = content.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }
    return lines;
}

std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);
    auto temp = path;
    temp += ".tmp." + std::to_string(dis(gen));
    return temp;
}

} // anonymous namespace

std::expected<ConfDocument, ConfError> ConfDocument::parse(std::string_view content) {
    ConfDocument doc;
    auto lines = split_lines(content);
    doc.lines_.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        auto line = parse_line(lines[i], i + 1);
        if (!line) {
            logger().debug("Rejected line {}: {}", line.error().line, line.error().message);
            return std::unexpected(std::move(line.error()));
        }
        if (const auto* setting = std::get_if<Setting>(&*line)) {
            // Later duplicates win the index
            doc.key_index_.insert_or_assign(setting->key, doc.lines_.size());
        }
        doc.lines_.push_back(std::move(*line));
    }

    logger().trace("Parsed {} lines, {} keys", doc.lines_.size(), doc.key_index_.size());
    return doc;
}

std::expected<ConfDocument, ConfError> ConfDocument::load(const std::filesystem::path& path) {
    // ifstream opens directories on Linux and then reads nothing
    std::error_code dir_ec;
    if (std::filesystem::is_directory(path, dir_ec)) {
        auto ec = std::make_error_code(std::errc::is_a_directory);
        logger().warn("Cannot read {}: {}", path.string(), ec.message());
        return std::unexpected(ConfError::io_failure(ec, "cannot read " + path.string()));
    }

    errno = 0;
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::error_code ec(errno ? errno : ENOENT, std::generic_category());
        logger().warn("Cannot open {}: {}", path.string(), ec.message());
        return std::unexpected(ConfError::io_failure(ec, "cannot read " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        std::error_code ec(EIO, std::generic_category());
        logger().warn("Read failed for {}", path.string());
        return std::unexpected(ConfError::io_failure(ec, "cannot read " + path.string()));
    }

    logger().debug("Loaded {}", path.string());
    return parse(buffer.str());
}

std::expected<void, ConfError> ConfDocument::save(const std::filesystem::path& path) const {
    namespace fs = std::filesystem;

    // Replace the file a symlink points to, not the link itself
    std::error_code ec;
    fs::path target = fs::weakly_canonical(path, ec);
    if (ec) {
        target = path;
    }
    auto temp = temp_path_for(target);

    // The new file keeps the mode of the one it replaces (e.g. 0600)
    auto status = fs::status(target, ec);
    bool replacing = fs::exists(status);
    ec.clear();

    {
        errno = 0;
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            std::error_code open_ec(errno ? errno : EACCES, std::generic_category());
            logger().warn("Cannot create {}: {}", temp.string(), open_ec.message());
            return std::unexpected(ConfError::io_failure(open_ec, "cannot write " + path.string()));
        }
        if (replacing) {
            fs::permissions(temp, status.permissions(), fs::perm_options::replace, ec);
        }
        if (!ec) {
            file << to_text();
            file.flush();
            if (!file) {
                ec = std::error_code(EIO, std::generic_category());
            }
        }
    }

    if (!ec) {
        fs::rename(temp, target, ec);
    }
    if (ec) {
        logger().warn("Cannot replace {}: {}", target.string(), ec.message());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return std::unexpected(ConfError::io_failure(ec, "cannot write " + path.string()));
    }

    logger().debug("Saved {} ({} lines)", target.string(), lines_.size());
    return {};
}

const Setting* ConfDocument::setting_at(size_t index) const {
    if (index >= lines_.size()) {
        return nullptr;
    }
    return std::get_if<Setting>(&lines_[index]);
}

std::optional<std::string> ConfDocument::get(std::string_view key) const {
    auto it = key_index_.find(key);
    if (it == key_index_.end()) {
        return std::nullopt;
    }
    if (const auto* setting = setting_at(it->second)) {
        return setting->value;
    }
    return std::nullopt;
}

std::optional<int64_t> ConfDocument::get_int(std::string_view key) const {
    auto value = get(key);
    return value ? parse_int(*value) : std::nullopt;
}

std::optional<bool> ConfDocument::get_bool(std::string_view key) const {
    auto value = get(key);
    return value ? parse_bool(*value) : std::nullopt;
}

std::optional<double> ConfDocument::get_float(std::string_view key) const {
    auto value = get(key);
    return value ? parse_float(*value) : std::nullopt;
}

bool ConfDocument::contains_key(std::string_view key) const {
    return key_index_.find(key) != key_index_.end();
}

void ConfDocument::set(std::string_view key, std::string_view value) {
    Setting setting{std::string(key), std::string(value)};

    auto it = key_index_.find(key);
    if (it != key_index_.end()) {
        logger().debug("Updating {} at line {}", setting.key, it->second + 1);
        lines_[it->second] = std::move(setting);
        return;
    }

    size_t index = lines_.size();
    logger().debug("Appending {} at line {}", setting.key, index + 1);
    key_index_.emplace(setting.key, index);
    lines_.push_back(std::move(setting));
}

bool ConfDocument::remove(std::string_view key) {
    auto it = key_index_.find(key);
    if (it == key_index_.end()) {
        return false;
    }
    logger().debug("Removing {} at line {}", it->first, it->second + 1);
    lines_[it->second] = Empty{};
    key_index_.erase(it);
    return true;
}

std::vector<std::string> ConfDocument::keys() const {
    std::vector<std::string> result;
    result.reserve(key_index_.size());
    for (const auto& [key, index] : key_index_) {
        result.push_back(key);
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> ConfDocument::get_matching(std::string_view pattern) const {
    std::vector<std::pair<std::string, std::string>> result;
    for (const auto& [key, index] : key_index_) {
        if (!matches(key, pattern)) {
            continue;
        }
        if (const auto* setting = setting_at(index)) {
            result.emplace_back(key, setting->value);
        }
    }
    return result;
}

bool ConfDocument::is_pattern(std::string_view key) {
    return rmqconf::is_pattern(key);
}

std::string ConfDocument::to_text() const {
    std::string out;
    for (const auto& line : lines_) {
        if (const auto* setting = std::get_if<Setting>(&line)) {
            out += setting->key;
            out += " = ";
            out += format_value(setting->value);
        } else if (const auto* comment = std::get_if<Comment>(&line)) {
            out += comment->text;
        }
        out += '\n';
    }
    return out;
}

} // namespace rmqconf
