#ifndef TALLY_TEST_HELPERS_HPP
#define TALLY_TEST_HELPERS_HPP

#include <string>
#include <vector>
#include "transaction.hpp"

namespace tally {
namespace test_support {

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir {
    public:
        TempDir();
        ~TempDir();
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        const std::string& path() const { return path_; }
        std::string file(const std::string& name) const;

    private:
        std::string path_;
    };

    void write_text(const std::string& path, const std::string& content);
    std::string read_text(const std::string& path);
    std::vector<std::string> list_dir(const std::string& dir);

    Transaction make_tx(int64_t id, const std::string& date, Kind kind, money_cents amount,
                        const std::string& category, const std::string& created_at = "2025-01-01T00:00:00");

} // namespace test_support
} // namespace tally

#endif
