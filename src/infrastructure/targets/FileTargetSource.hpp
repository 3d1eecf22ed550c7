#pragma once

#include "core/services/ITargetSource.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Reads candidate targets from a line-oriented text file.
 *
 * One target per line. '#' starts a comment, either for the whole line or
 * inline; everything from the marker onward is discarded. The first token of
 * a remaining line is the candidate identifier, the second (if any) its label.
 */
class FileTargetSource : public core::ITargetSource {
public:
    /**
     * @brief Constructs a source for an already resolved path.
     * @param path Path to the target-list file.
     */
    explicit FileTargetSource(std::filesystem::path path);

    /**
     * @brief Reads and tokenizes the file.
     * @return Entries in file order.
     * @throws core::SourceNotFoundError if the file does not exist.
     * @throws core::EmptySourceError if no non-comment line is present.
     */
    std::vector<core::TargetEntry> read() override;

    std::string describe() const override { return path_.string(); }

    /**
     * @brief Tokenizes a stream without touching the filesystem.
     * @param input Stream with target-list content.
     * @return Entries in stream order (may be empty).
     */
    static std::vector<core::TargetEntry> parse(std::istream& input);

    /**
     * @brief Resolves a target-list path the way the CLI and scheduler expect.
     *
     * Absolute paths are used as-is. Relative paths are tried against the
     * working directory (only when searchWorkingDirectory is set), then
     * baseDir/config, then baseDir. When nothing exists the baseDir/config
     * candidate is returned so that the error names a predictable location.
     */
    static std::filesystem::path resolve(const std::string& path,
                                         const std::filesystem::path& baseDir,
                                         bool searchWorkingDirectory);

private:
    std::filesystem::path path_;
};

} // namespace pingsweep::infra
