#include "test_helpers.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace tally {
namespace test_support {

TempDir::TempDir() {
    std::string pattern = (fs::temp_directory_path() / "tally-test-XXXXXX").string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed");
    }
    path_ = buf.data();
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
    fs::remove_all(path_, ec);
}

std::string TempDir::file(const std::string& name) const {
    return (fs::path(path_) / name).string();
}

void write_text(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> list_dir(const std::string& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

Transaction make_tx(int64_t id, const std::string& date, Kind kind, money_cents amount,
                    const std::string& category, const std::string& created_at) {
    Transaction t;
    t.id = id;
    t.date = date;
    t.kind = kind;
    t.amount = amount;
    t.category = category;
    t.created_at = created_at;
    return t;
}

} // namespace test_support
} // namespace tally
