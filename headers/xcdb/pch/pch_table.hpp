//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef XCDB_PCH_TABLE_HPP
#define XCDB_PCH_TABLE_HPP

/**
 * @file pch_table.hpp
 * @brief Maps precompiled header artifacts back to their header sources.
 *
 * ProcessPCH sections compile a header into an artifact such as
 * "Prefix.pch.pch" or "Prefix.pch.pth"; later CompileC sections refer to
 * the artifact through "-include .../Prefix.pch", a path that usually
 * does not exist on disk. The table is filled while scanning precompile
 * sections and consulted by compile sections that follow them in the log.
 *
 * One table belongs to one conversion run. It is not thread-safe.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace xcdb::pch {

    /**
     * Suffixes tried, in order, when resolving an -include argument.
     */
    inline constexpr std::string_view PTH_SUFFIX = ".pth";
    inline constexpr std::string_view PCH_SUFFIX = ".pch";

    class PchTable {
    public:
        /**
         * Records that `artifact` was produced from `header`.
         * An existing entry for the same artifact is replaced.
         */
        void register_header(std::string artifact, std::string header);

        /**
         * Exact lookup of an artifact path.
         */
        [[nodiscard]] std::optional<std::string> find(const std::string& artifact) const;

        /**
         * Resolves an -include argument to the original header.
         *
         * Tries include_path + ".pth", then include_path + ".pch", then
         * include_path itself.
         */
        [[nodiscard]] std::optional<std::string> resolve(std::string_view include_path) const;

        [[nodiscard]] bool contains(const std::string& artifact) const;
        [[nodiscard]] std::size_t size() const noexcept { return headers_.size(); }
        [[nodiscard]] bool empty() const noexcept { return headers_.empty(); }

    private:
        std::unordered_map<std::string, std::string> headers_;
    };

}  // namespace xcdb::pch

#endif //XCDB_PCH_TABLE_HPP
