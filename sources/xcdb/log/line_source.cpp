//
// Created by gregorian-rayne on 2/11/26.
//

#include "xcdb/log/line_source.hpp"
#include "xcdb/utils/string_utils.hpp"

#include <nlohmann/json.hpp>

namespace xcdb::log {

    using json = nlohmann::json;

    namespace {

    constexpr const char* COMMAND_FIELD = "command";

    void strip_carriage_return(std::string& line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }

    }  // namespace

    // ============================================================================
    // StreamLineSource
    // ============================================================================

    StreamLineSource::StreamLineSource(std::istream& input)
        : input_(input) {}

    std::optional<std::string> StreamLineSource::next_line() {
        std::string line;
        if (!std::getline(input_, line)) {
            if (input_.bad()) {
                fail(Error::io_error("Failed to read build log", "stream"));
            }
            return std::nullopt;
        }
        strip_carriage_return(line);
        return line;
    }

    // ============================================================================
    // JsonLinesSource
    // ============================================================================

    JsonLinesSource::JsonLinesSource(std::istream& input)
        : input_(input) {}

    std::optional<std::string> JsonLinesSource::next_line() {
        while (pending_.empty()) {
            if (failed() || !fill_pending()) {
                return std::nullopt;
            }
        }

        std::string line = std::move(pending_.front());
        pending_.pop_front();
        return line;
    }

    bool JsonLinesSource::fill_pending() {
        std::string raw;
        if (!std::getline(input_, raw)) {
            if (input_.bad()) {
                fail(Error::io_error("Failed to read JSON-lines input", "stream"));
            }
            return false;
        }
        ++line_number_;

        if (string_utils::trim(raw).empty()) {
            return true;
        }

        const json record = json::parse(raw, nullptr, false);
        if (record.is_discarded()) {
            fail(Error::parse_error("Invalid JSON record", "line " + std::to_string(line_number_)));
            return false;
        }

        if (!record.is_object()) {
            return true;
        }
        const auto it = record.find(COMMAND_FIELD);
        if (it == record.end() || !it->is_string()) {
            return true;
        }

        for (auto& line : string_utils::split_lines(it->get<std::string>())) {
            pending_.push_back(std::move(line));
        }
        return true;
    }

    // ============================================================================
    // VectorLineSource
    // ============================================================================

    VectorLineSource::VectorLineSource(std::vector<std::string> lines)
        : lines_(std::move(lines)) {}

    std::optional<std::string> VectorLineSource::next_line() {
        if (position_ >= lines_.size()) {
            return std::nullopt;
        }
        return lines_[position_++];
    }

}  // namespace xcdb::log
