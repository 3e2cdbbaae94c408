/**
 * ============================================================================
 * SOFTWARE: Tally: Personal Finance Tracker
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: transaction.cpp
 * ============================================================================
 */

#include "transaction.hpp"
#include "errors.hpp"
#include <cctype>

namespace tally {

namespace {

std::string optional_string(const json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

} // namespace

bool operator==(const Transaction& a, const Transaction& b) {
    return a.id == b.id && a.date == b.date && a.kind == b.kind && a.amount == b.amount
        && a.category == b.category && a.note == b.note && a.created_at == b.created_at;
}

bool operator!=(const Transaction& a, const Transaction& b) {
    return !(a == b);
}

std::string kind_to_string(Kind kind) {
    return kind == Kind::Income ? "income" : "expense";
}

Kind parse_kind(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    std::string s;
    for (size_t i = start; i < end; ++i) {
        s += static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    }
    if (s.empty() || s == "expense") return Kind::Expense;
    if (s == "income") return Kind::Income;
    throw InvalidKindError("Type must be 'income' or 'expense', got '" + text + "'.");
}

void to_json(json& j, const Transaction& t) {
    j = json{
        {"id", t.id},
        {"date", t.date},
        {"type", kind_to_string(t.kind)},
        {"amount", to_decimal(t.amount)},
        {"category", t.category},
        {"note", t.note},
        {"created_at", t.created_at}
    };
}

void from_json(const json& j, Transaction& t) {
    if (!j.is_object()) {
        throw CorruptDataError("Transaction entry is not an object.");
    }

    auto id = j.find("id");
    if (id == j.end() || !id->is_number_integer()) {
        throw CorruptDataError("Transaction entry has no integer id.");
    }
    t.id = id->get<int64_t>();

    auto type = j.find("type");
    if (type == j.end() || !type->is_string()) {
        throw CorruptDataError("Transaction " + std::to_string(t.id) + " has no type.");
    }
    const std::string type_text = type->get<std::string>();
    if (type_text == "income") {
        t.kind = Kind::Income;
    } else if (type_text == "expense") {
        t.kind = Kind::Expense;
    } else {
        throw CorruptDataError("Transaction " + std::to_string(t.id) + " has unknown type '" + type_text + "'.");
    }

    auto amount = j.find("amount");
    if (amount == j.end() || !amount->is_number()) {
        throw CorruptDataError("Transaction " + std::to_string(t.id) + " has no numeric amount.");
    }
    double value = amount->get<double>();
    if (!(value >= 0.0) || value > to_decimal(MAX_AMOUNT_CENTS)) {
        throw CorruptDataError("Transaction " + std::to_string(t.id) + " has an out-of-range amount.");
    }
    t.amount = from_decimal(value);

    t.date = optional_string(j, "date", "");
    t.category = optional_string(j, "category", UNCATEGORIZED);
    if (t.category.empty()) t.category = UNCATEGORIZED;
    t.note = optional_string(j, "note", "");
    t.created_at = optional_string(j, "created_at", "");
}

} // namespace tally
