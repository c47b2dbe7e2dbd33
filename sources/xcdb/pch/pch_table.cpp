//
// Created by gregorian-rayne on 2/10/26.
//

#include "xcdb/pch/pch_table.hpp"

namespace xcdb::pch {

    void PchTable::register_header(std::string artifact, std::string header) {
        headers_.insert_or_assign(std::move(artifact), std::move(header));
    }

    std::optional<std::string> PchTable::find(const std::string& artifact) const {
        if (const auto it = headers_.find(artifact); it != headers_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::optional<std::string> PchTable::resolve(const std::string_view include_path) const {
        const std::string base(include_path);

        if (auto header = find(base + std::string(PTH_SUFFIX))) {
            return header;
        }
        if (auto header = find(base + std::string(PCH_SUFFIX))) {
            return header;
        }
        return find(base);
    }

    bool PchTable::contains(const std::string& artifact) const {
        return headers_.contains(artifact);
    }

}  // namespace xcdb::pch
