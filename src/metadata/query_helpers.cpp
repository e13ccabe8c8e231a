#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <numeric>
#include <string>
#include <string_view>
#include <mediadex/metadata/query_helpers.h>

namespace mediadex::metadata::sql {

namespace {

inline std::string joinWithSeparator(const std::vector<std::string>& items,
                                     std::string_view separator) {
    if (items.empty()) {
        return {};
    }

    const auto totalChars =
        std::accumulate(items.begin(), items.end(), static_cast<std::size_t>(0),
                        [](std::size_t sum, const std::string& part) { return sum + part.size(); });

    std::string joined;
    joined.reserve(totalChars + separator.size() * (items.size() - 1));

    joined.append(items.front());
    for (std::size_t idx = 1; idx < items.size(); ++idx) {
        joined.append(separator);
        joined.append(items[idx]);
    }
    return joined;
}

template <typename OptString>
inline void appendClause(std::string& sql, std::string_view keyword, const OptString& opt) {
    if (opt && !opt->empty()) {
        sql += ' ';
        sql += keyword;
        sql += ' ';
        sql += *opt;
    }
}

inline void appendLimitOffset(std::string& sql, const std::optional<int64_t>& limit,
                              const std::optional<int64_t>& offset) {
    if (limit && *limit > 0) {
        sql += " LIMIT ";
        sql += std::to_string(*limit);
        // OFFSET is only valid after LIMIT in SQLite
        if (offset && *offset > 0) {
            sql += " OFFSET ";
            sql += std::to_string(*offset);
        }
    }
}

std::string trimmed(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
        return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

std::string lowered(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "(a OR b ...)" over LIKE patterns on the file name
void appendNameAlternatives(Clause& clause, const std::vector<std::string>& patterns) {
    if (patterns.empty())
        return;
    std::vector<std::string> parts(patterns.size(), "f.name LIKE ? ESCAPE '\\'");
    clause.conditions.push_back("(" + joinWithSeparator(parts, " OR ") + ")");
    for (const auto& p : patterns)
        clause.params.emplace_back(p);
}

} // namespace

std::string buildSelect(const QuerySpec& spec) {
    const std::string cols =
        spec.columns.empty() ? std::string{"*"} : joinWithSeparator(spec.columns, ", ");
    std::string sql;
    sql.reserve(64 + cols.size() + spec.table.size());
    sql += "SELECT ";
    sql += cols;
    sql += " FROM ";
    sql += (spec.from && !spec.from->empty()) ? *spec.from : spec.table;

    if (!spec.conditions.empty()) {
        sql += " WHERE ";
        sql += joinWithSeparator(spec.conditions, " AND ");
    }
    appendClause(sql, "GROUP BY", spec.groupBy);
    appendClause(sql, "HAVING", spec.having);
    appendClause(sql, "ORDER BY", spec.orderBy);
    appendLimitOffset(sql, spec.limit, spec.offset);
    return sql;
}

void Clause::append(Clause other) {
    conditions.insert(conditions.end(), std::make_move_iterator(other.conditions.begin()),
                      std::make_move_iterator(other.conditions.end()));
    params.insert(params.end(), std::make_move_iterator(other.params.begin()),
                  std::make_move_iterator(other.params.end()));
}

std::string escapeLike(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '%' || c == '_' || c == '\\')
            out += '\\';
        out += c;
    }
    return out;
}

Clause metadataFilterClause(const MetadataFilter& filter) {
    Clause criteria;
    auto add = [&criteria](const char* condition, Param value) {
        criteria.conditions.emplace_back(condition);
        criteria.params.push_back(std::move(value));
    };

    if (filter.model && !filter.model->empty())
        add("s.model_name = ?", *filter.model);
    if (filter.sampler && !filter.sampler->empty())
        add("s.sampler_name = ?", *filter.sampler);
    if (filter.scheduler && !filter.scheduler->empty())
        add("s.scheduler = ?", *filter.scheduler);
    if (filter.cfgMin)
        add("s.cfg >= ?", *filter.cfgMin);
    if (filter.cfgMax)
        add("s.cfg <= ?", *filter.cfgMax);
    if (filter.stepsMin)
        add("s.steps >= ?", *filter.stepsMin);
    if (filter.stepsMax)
        add("s.steps <= ?", *filter.stepsMax);
    if (filter.widthMin)
        add("s.width >= ?", *filter.widthMin);
    if (filter.widthMax)
        add("s.width <= ?", *filter.widthMax);
    if (filter.heightMin)
        add("s.height >= ?", *filter.heightMin);
    if (filter.heightMax)
        add("s.height <= ?", *filter.heightMax);

    Clause out;
    if (criteria.conditions.empty())
        return out;

    constexpr std::string_view kExists =
        "EXISTS (SELECT 1 FROM samplers s WHERE s.file_id = f.id AND {})";
    if (filter.match == SamplerMatch::SameSampler) {
        out.conditions.push_back(
            fmt::format(fmt::runtime(kExists), joinWithSeparator(criteria.conditions, " AND ")));
    } else {
        for (const auto& condition : criteria.conditions)
            out.conditions.push_back(fmt::format(fmt::runtime(kExists), condition));
    }
    out.params = std::move(criteria.params);
    return out;
}

Clause fileQueryClause(const FileQuery& query) {
    Clause clause;

    if (!query.scope.folder.empty()) {
        std::string folder = query.scope.folder;
        while (folder.size() > 1 && folder.back() == '/')
            folder.pop_back();
        if (query.scope.recursive) {
            // Descendants sort in [folder + "/", folder + "0") under binary collation
            std::string prefix = folder == "/" ? folder : folder + "/";
            std::string upper = prefix;
            upper.back() = '0';
            clause.conditions.emplace_back("(f.folder = ? OR (f.folder >= ? AND f.folder < ?))");
            clause.params.emplace_back(folder);
            clause.params.emplace_back(std::move(prefix));
            clause.params.emplace_back(std::move(upper));
        } else {
            clause.conditions.emplace_back("f.folder = ?");
            clause.params.emplace_back(folder);
        }
    }

    clause.append(metadataFilterClause(query.metadata));

    if (query.search) {
        auto term = trimmed(*query.search);
        if (!term.empty()) {
            clause.conditions.emplace_back("f.name LIKE ? ESCAPE '\\'");
            clause.params.emplace_back("%" + escapeLike(term) + "%");
        }
    }

    if (query.favoritesOnly)
        clause.conditions.emplace_back("f.is_favorite = 1");

    std::vector<std::string> prefixPatterns;
    for (const auto& p : query.prefixes) {
        auto prefix = trimmed(p);
        if (!prefix.empty())
            prefixPatterns.push_back(escapeLike(prefix) + "\\_%");
    }
    appendNameAlternatives(clause, prefixPatterns);

    std::vector<std::string> extensionPatterns;
    for (const auto& e : query.extensions) {
        auto ext = trimmed(e);
        while (!ext.empty() && ext.front() == '.')
            ext.erase(ext.begin());
        if (!ext.empty())
            extensionPatterns.push_back("%." + escapeLike(lowered(ext)));
    }
    appendNameAlternatives(clause, extensionPatterns);

    return clause;
}

Result<void> bindParams(Statement& stmt, const std::vector<Param>& params, int firstIndex) {
    int index = firstIndex;
    for (const auto& param : params) {
        auto bound = std::visit([&](const auto& value) { return stmt.bind(index, value); }, param);
        if (!bound)
            return bound;
        ++index;
    }
    return {};
}

} // namespace mediadex::metadata::sql
