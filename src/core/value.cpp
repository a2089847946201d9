#include <rangedb/core/value.h>

#include <charconv>
#include <cstdlib>

namespace rangedb {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string toHex(const ByteVector& bytes) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        const auto v = std::to_integer<unsigned>(b);
        out.push_back(kDigits[v >> 4]);
        out.push_back(kDigits[v & 0x0f]);
    }
    return out;
}

} // namespace

std::string describeValue(const Value& value) {
    return std::visit(overloaded{
                          [](std::nullptr_t) -> std::string { return "n"; },
                          [](std::int64_t v) -> std::string { return "i:" + std::to_string(v); },
                          [](double v) -> std::string {
                              char buf[64];
                              auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), v);
                              if (ec != std::errc{}) {
                                  return "r:" + std::to_string(v);
                              }
                              return "r:" + std::string(buf, end);
                          },
                          [](bool v) -> std::string { return v ? "b:1" : "b:0"; },
                          [](const std::string& v) -> std::string {
                              return "s:" + std::to_string(v.size()) + ":" + v;
                          },
                          [](const ByteVector& v) -> std::string { return "x:" + toHex(v); },
                      },
                      value);
}

nlohmann::json valueToJson(const Value& value) {
    return std::visit(overloaded{
                          [](std::nullptr_t) -> nlohmann::json { return nullptr; },
                          [](std::int64_t v) -> nlohmann::json { return v; },
                          [](double v) -> nlohmann::json { return v; },
                          [](bool v) -> nlohmann::json { return v; },
                          [](const std::string& v) -> nlohmann::json { return v; },
                          [](const ByteVector& v) -> nlohmann::json { return toHex(v); },
                      },
                      value);
}

std::size_t QueryResult::memorySize() const {
    std::size_t total = sizeof(QueryResult);
    for (const auto& c : columns) {
        total += sizeof(std::string) + c.size();
    }
    for (const auto& row : rows) {
        total += sizeof(Row) + row.size() * sizeof(Value);
        for (const auto& cell : row) {
            if (auto s = std::get_if<std::string>(&cell)) {
                total += s->size();
            } else if (auto b = std::get_if<ByteVector>(&cell)) {
                total += b->size();
            }
        }
    }
    return total;
}

nlohmann::json QueryResult::toJson() const {
    auto out = nlohmann::json::array();
    for (const auto& row : rows) {
        nlohmann::json obj = nlohmann::json::object();
        for (std::size_t i = 0; i < row.size() && i < columns.size(); ++i) {
            obj[columns[i]] = valueToJson(row[i]);
        }
        out.push_back(std::move(obj));
    }
    return out;
}

Value parseLiteral(const std::string& text) {
    if (text == "null" || text == "NULL") {
        return nullptr;
    }
    if (text == "true") {
        return true;
    }
    if (text == "false") {
        return false;
    }
    std::int64_t i = 0;
    auto [iend, iec] = std::from_chars(text.data(), text.data() + text.size(), i);
    if (iec == std::errc{} && iend == text.data() + text.size() && !text.empty()) {
        return i;
    }
    if (!text.empty()) {
        char* end = nullptr;
        const double d = std::strtod(text.c_str(), &end);
        if (end == text.c_str() + text.size()) {
            return d;
        }
    }
    return text;
}

} // namespace rangedb
