#include "infrastructure/targets/QueryTargetSource.hpp"

#include "core/Errors.hpp"
#include "infrastructure/database/Database.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace pingsweep::infra {

QueryTargetSource::QueryTargetSource(std::filesystem::path inventoryDatabase,
                                     std::filesystem::path sqlFile)
    : inventoryDatabase_(std::move(inventoryDatabase)), sqlFile_(std::move(sqlFile)) {}

std::string QueryTargetSource::describe() const {
    return sqlFile_.filename().string() + " on " +
           (inventoryDatabase_.empty() ? std::string("<no inventory>")
                                       : inventoryDatabase_.string());
}

std::string QueryTargetSource::loadQuery() const {
    std::ifstream file(sqlFile_);
    if (!file) {
        throw core::SourceNotFoundError(sqlFile_.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    auto query = oss.str();

    if (query.find_first_not_of(" \t\r\n;") == std::string::npos) {
        throw core::EmptySourceError(sqlFile_.string());
    }
    return query;
}

std::vector<core::TargetEntry> QueryTargetSource::read() {
    if (inventoryDatabase_.empty()) {
        throw core::SourceNotFoundError("inventory database (not configured)");
    }
    if (!std::filesystem::exists(inventoryDatabase_)) {
        throw core::SourceNotFoundError(inventoryDatabase_.string());
    }
    if (!std::filesystem::exists(sqlFile_)) {
        throw core::SourceNotFoundError(sqlFile_.string());
    }

    auto query = loadQuery();

    Database db(inventoryDatabase_.string(), Database::OpenMode::ReadOnly);
    auto stmt = db.prepare(query);

    std::vector<core::TargetEntry> entries;
    std::size_t row = 0;
    while (stmt.step()) {
        ++row;
        if (stmt.columnCount() < 1 || stmt.columnIsNull(0)) {
            spdlog::debug("Skipping row {} of {}: no identifier", row, describe());
            continue;
        }

        core::TargetEntry entry;
        entry.candidate = stmt.columnText(0);
        entry.rawLine = entry.candidate;
        entry.lineNumber = row;
        if (stmt.columnCount() > 1 && !stmt.columnIsNull(1)) {
            entry.label = stmt.columnText(1);
            entry.rawLine += " " + *entry.label;
        }
        entries.push_back(std::move(entry));
    }

    if (entries.empty()) {
        throw core::EmptySourceError(describe());
    }

    spdlog::debug("Query {} returned {} candidate targets", sqlFile_.filename().string(),
                  entries.size());
    return entries;
}

} // namespace pingsweep::infra
