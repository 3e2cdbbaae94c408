/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: atomic_file.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Whole-file persistence used by both stores. A write goes to a temporary
 * file beside the target, is flushed to disk, and is then renamed over the
 * target, so readers only ever see the previous or the new full content.
 * ============================================================================
 */

#ifndef TALLY_ATOMIC_FILE_HPP
#define TALLY_ATOMIC_FILE_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace tally {

    /**
     * read_file
     * @return The file content, or std::nullopt when the file does not exist.
     * Throws IOFailure when the file exists but cannot be read.
     */
    std::optional<std::string> read_file(const std::string& path);

    /**
     * write_file_atomic
     * Creates the parent directory if needed. Throws IOFailure on any write,
     * fsync or rename error; the target is left untouched in that case and
     * the temporary file is removed.
     */
    void write_file_atomic(const std::string& path, const std::string& content);

    /**
     * quarantine_file
     * Renames a file aside to "<path>.corrupt-<epoch-ms>" and returns the new
     * path. Throws IOFailure if the rename fails.
     */
    std::string quarantine_file(const std::string& path);

    /**
     * remove_stale_temp_files
     * Deletes ".<name>.tmpXXXXXX" leftovers of `path` from writes that never
     * reached their rename. Only safe while no other writer is active.
     * @return Number of files removed.
     */
    size_t remove_stale_temp_files(const std::string& path);

} // namespace tally

#endif // TALLY_ATOMIC_FILE_HPP
