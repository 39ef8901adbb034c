#include <sparql_mcp/sparql/sparql_format.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace sparql_mcp {

namespace {

constexpr const char* kNoAuthorsFound = "No authors found for that DOI.";

// Discarded value (is_discarded()) when body is not valid JSON.
nlohmann::json ParseOrDiscard(const std::string& body) {
    return nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
}

std::string Pretty(const nlohmann::json& j) {
    return j.dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

std::string FormatSparqlFailure(const SparqlResponse& response) {
    std::ostringstream oss;
    oss << "SPARQL error (HTTP " << response.status << "): "
        << response.error.value_or("unknown error");
    if (!response.body.empty()) {
        oss << "\n" << response.body;
    }
    return oss.str();
}

std::string FormatSparqlResultAsText(const SparqlResponse& response) {
    if (!response.ok) {
        return FormatSparqlFailure(response);
    }
    auto data = ParseOrDiscard(response.body);
    if (data.is_discarded() || data.is_null()) {
        return response.body;
    }
    return Pretty(data);
}

std::string BuildAuthorsByDoiQuery(const std::string& doi) {
    std::string literal;
    literal.reserve(doi.size());
    for (char c : doi) {
        if (c == '"') literal += '\\';
        literal += c;
    }

    std::string query;
    query += "PREFIX schema: <https://schema.org/>\n";
    query += "\n";
    query += "SELECT DISTINCT ?authorName WHERE {\n";
    query += "  ?article a schema:ScholarlyArticle ;\n";
    query += "           schema:identifier ?doi ;\n";
    query += "           schema:author ?author .\n";
    query += "\n";
    query += "  ?author a schema:Person ;\n";
    query += "          schema:name ?authorName .\n";
    query += "\n";
    query += "  FILTER( LCASE(STR(?doi)) = LCASE(\"" + literal + "\") )\n";
    query += "}\n";
    query += "ORDER BY ?authorName";
    return query;
}

std::vector<std::string> ExtractAuthorNames(const std::string& sparql_json) {
    std::vector<std::string> names;
    auto data = ParseOrDiscard(sparql_json);
    if (data.is_discarded() || !data.is_object()) return names;

    auto results = data.find("results");
    if (results == data.end() || !results->is_object()) return names;
    auto bindings = results->find("bindings");
    if (bindings == results->end() || !bindings->is_array()) return names;

    for (const auto& row : *bindings) {
        if (!row.is_object()) continue;
        auto author = row.find("authorName");
        if (author == row.end() || !author->is_object()) continue;
        auto value = author->find("value");
        if (value != author->end() && value->is_string()) {
            names.push_back(value->get<std::string>());
        }
    }
    return names;
}

std::string FormatAuthorsResultAsText(const SparqlResponse& response) {
    if (!response.ok) {
        return FormatSparqlFailure(response);
    }

    auto data = ParseOrDiscard(response.body);
    if (data.is_discarded() || !data.is_object()) {
        return response.body;
    }

    const bool has_bindings = data.contains("results") &&
                              data["results"].is_object() &&
                              data["results"].contains("bindings");
    if (!has_bindings) {
        return Pretty(data);
    }

    auto names = ExtractAuthorNames(response.body);
    if (names.empty()) {
        return kNoAuthorsFound;
    }

    std::string out = "Authors:\n";
    for (const auto& name : names) {
        out += "- " + name + "\n";
    }
    return out;
}

} // namespace sparql_mcp
