#include "table/table.hpp"

#include <spdlog/spdlog.h>

namespace funtable {

std::string_view to_string(TableType type) noexcept {
    switch (type) {
        case TableType::Kv:  return "kv";
        case TableType::Kkv: return "kkv";
    }
    return "unknown";
}

std::optional<TableType> parse_table_type(std::string_view s) noexcept {
    if (s == "kv")  return TableType::Kv;
    if (s == "kkv") return TableType::Kkv;
    return std::nullopt;
}

void warn_transactions_unsupported(std::string_view table, std::string_view verb) {
    spdlog::warn("Table '{}': {}() ignored, document files do not support "
                 "transactions", table, verb);
}

} // namespace funtable
