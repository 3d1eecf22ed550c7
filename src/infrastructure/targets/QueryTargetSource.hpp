#pragma once

#include "core/services/ITargetSource.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Reads candidate targets from an inventory database query.
 *
 * The query text is loaded from a SQL file and run read-only against a SQLite
 * inventory. Column 0 of every row is the identifier, column 1 (when present
 * and not NULL) the label. Row numbers stand in for line numbers.
 */
class QueryTargetSource : public core::ITargetSource {
public:
    /**
     * @param inventoryDatabase Path to the inventory database; empty when no
     *        inventory is configured.
     * @param sqlFile Resolved path to the SQL file.
     */
    QueryTargetSource(std::filesystem::path inventoryDatabase, std::filesystem::path sqlFile);

    /**
     * @throws core::SourceNotFoundError if the inventory is not configured or
     *         the database or SQL file is missing.
     * @throws core::EmptySourceError if the SQL file is blank or the query
     *         returns no rows.
     */
    std::vector<core::TargetEntry> read() override;

    std::string describe() const override;

private:
    std::string loadQuery() const;

    std::filesystem::path inventoryDatabase_;
    std::filesystem::path sqlFile_;
};

} // namespace pingsweep::infra
