#include <rangedb/query/query_types.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace rangedb::query {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' ||
           static_cast<unsigned char>(c) >= 0x80;
}

// Index just past a quoted run starting at `i` (quote char at sql[i]); '' and "" escape.
std::size_t skipQuoted(std::string_view sql, std::size_t i) {
    const char open = sql[i];
    const char close = open == '[' ? ']' : open;
    ++i;
    while (i < sql.size()) {
        if (sql[i] == close) {
            if (close != ']' && i + 1 < sql.size() && sql[i + 1] == close) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return sql.size();
}

bool isQuote(char c) {
    return c == '\'' || c == '"' || c == '`' || c == '[';
}

} // namespace

std::string normalizeText(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());
    std::size_t i = 0;
    bool pendingSpace = false;
    while (i < sql.size()) {
        const char c = sql[i];
        if (isSpace(c)) {
            pendingSpace = true;
            ++i;
            continue;
        }
        if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            const auto nl = sql.find('\n', i);
            i = nl == std::string_view::npos ? sql.size() : nl + 1;
            pendingSpace = true;
            continue;
        }
        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            const auto end = sql.find("*/", i + 2);
            i = end == std::string_view::npos ? sql.size() : end + 2;
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) {
            out.push_back(' ');
        }
        pendingSpace = false;
        if (isQuote(c)) {
            const auto end = skipQuoted(sql, i);
            out.append(sql.substr(i, end - i));
            i = end;
            continue;
        }
        out.push_back(c);
        ++i;
    }
    while (!out.empty() && (out.back() == ';' || isSpace(out.back()))) {
        out.pop_back();
    }
    return out;
}

std::vector<std::string> namedParameterOrder(std::string_view sql, int* positionalCount) {
    std::vector<std::string> names;
    std::set<std::string> seen;
    int positional = 0;
    std::size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];
        if (isQuote(c)) {
            i = skipQuoted(sql, i);
            continue;
        }
        if (c == '-' && i + 1 < sql.size() && sql[i + 1] == '-') {
            const auto nl = sql.find('\n', i);
            i = nl == std::string_view::npos ? sql.size() : nl + 1;
            continue;
        }
        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            const auto end = sql.find("*/", i + 2);
            i = end == std::string_view::npos ? sql.size() : end + 2;
            continue;
        }
        if (c == '?') {
            ++positional;
            ++i;
            while (i < sql.size() && std::isdigit(static_cast<unsigned char>(sql[i]))) {
                ++i;
            }
            continue;
        }
        if ((c == ':' || c == '@' || c == '$') && i + 1 < sql.size() && isIdentChar(sql[i + 1])) {
            std::size_t j = i + 1;
            while (j < sql.size() && isIdentChar(sql[j])) {
                ++j;
            }
            std::string name(sql.substr(i, j - i));
            if (seen.insert(name).second) {
                names.push_back(std::move(name));
            }
            i = j;
            continue;
        }
        ++i;
    }
    if (positionalCount) {
        *positionalCount = positional;
    }
    return names;
}

Result<NormalizedQuery> normalize(const QueryRequest& request) {
    NormalizedQuery out;
    out.text = normalizeText(request.text);
    if (out.text.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty query"};
    }

    if (const auto* pos = std::get_if<Positional>(&request.params)) {
        out.params = pos->values;
        return out;
    }

    const auto& named = std::get<Named>(request.params).values;
    int positional = 0;
    const auto order = namedParameterOrder(out.text, &positional);
    if (positional > 0 && !order.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "statement mixes positional and named parameters"};
    }
    if (positional > 0 && !named.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "named parameters supplied for a statement with positional markers"};
    }

    out.params.reserve(order.size());
    for (const auto& name : order) {
        auto it = named.find(name);
        if (it == named.end()) {
            it = named.find(name.substr(1));
        }
        if (it == named.end()) {
            return Error{ErrorCode::InvalidArgument, "missing value for parameter " + name};
        }
        out.params.push_back(it->second);
    }
    if (named.size() > order.size()) {
        spdlog::debug("{} named parameter(s) not referenced by the statement",
                      named.size() - order.size());
    }
    return out;
}

StatementKind classifyStatement(std::string_view sql) {
    std::size_t i = 0;
    while (i < sql.size() && (isSpace(sql[i]) || sql[i] == '(')) {
        ++i;
    }
    std::size_t j = i;
    while (j < sql.size() && std::isalpha(static_cast<unsigned char>(sql[j]))) {
        ++j;
    }
    std::string word(sql.substr(i, j - i));
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    if (word == "SELECT" || word == "WITH" || word == "VALUES" || word == "EXPLAIN") {
        return StatementKind::Read;
    }
    return StatementKind::Other;
}

} // namespace rangedb::query
