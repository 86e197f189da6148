#include "spydirwebz/json/record.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace spydirwebz {
namespace json {

using nlohmann::json;

namespace {

const json& member(const json& obj, const std::string& key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw MalformedPuzzle(where + ": missing field '" + key + "'");
    }
    return *it;
}

std::string string_of(const json& v, const std::string& key, const std::string& where) {
    if (!v.is_string()) {
        throw MalformedPuzzle(where + ": field '" + key + "' must be a string, got " +
                              v.type_name());
    }
    return v.get<std::string>();
}

std::string string_field(const json& obj, const std::string& key, const std::string& where) {
    return string_of(member(obj, key, where), key, where);
}

std::string optional_string(const json& obj, const std::string& key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return "";
    }
    return string_of(*it, key, where);
}

std::vector<std::string> string_list(const json& obj, const std::string& key) {
    const json& list = member(obj, key, "puzzle");
    try {
        return list.get<std::vector<std::string>>();
    } catch (const json::type_error&) {
        throw MalformedPuzzle("puzzle: field '" + key + "' must be an array of strings");
    }
}

bool has_references(const json& clue) {
    return clue.contains("actor") || clue.contains("vector") ||
           clue.contains("asset") || clue.contains("data");
}

Clue read_clue(const json& record, size_t index, const ElementSet& elements) {
    const std::string where = "clue #" + std::to_string(index + 1);
    if (!record.is_object()) {
        throw MalformedPuzzle(where + ": expected object, got " + record.type_name());
    }

    const std::string type = string_field(record, "type", where);
    auto kind = parse_clue_kind(type);
    if (!kind) {
        throw MalformedPuzzle(where + ": unknown clue type '" + type + "'");
    }

    if (has_references(record)) {
        auto field = [&](const char* key) { return string_field(record, key, where); };
        switch (*kind) {
            case ClueKind::Negation:
                return NegationClue{field("actor"), field("vector")};
            case ClueKind::Affirmative:
                return AffirmativeClue{field("vector"), field("asset")};
            case ClueKind::Relational:
                return RelationalClue{field("vector"), field("asset")};
            case ClueKind::Conditional:
                return ConditionalClue{field("actor"), field("vector"), field("asset")};
            case ClueKind::DataInference:
                return DataInferenceClue{field("vector"), field("data")};
        }
    }

    const std::string text = optional_string(record, "text", where);
    if (text.empty()) {
        throw MalformedPuzzle(where + ": needs either element references or text");
    }
    auto clue = parse_clue_text(*kind, text, elements);
    if (!clue) {
        throw MalformedPuzzle(where + ": text does not match the " + type +
                              " template with known elements: '" + text + "'");
    }
    return *clue;
}

json triplet_json(const Triplet& t) {
    return json{{"actor", t.actor}, {"vector", t.vector}, {"asset", t.asset}};
}

json solution_json(const Solution& sol) {
    json j = triplet_json(sol.triplet);
    // 空文字列は「手がかりからデータが導けない」
    j["stolen_data"] = sol.stolen_data.empty() ? json(nullptr) : json(sol.stolen_data);
    return j;
}

Puzzle parse_document(std::istream& in, const std::string& source) {
    json document;
    try {
        document = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Parse error: " + source + ": " + e.what());
    }
    return to_puzzle(document);
}

}  // namespace

Puzzle to_puzzle(const json& record) {
    if (!record.is_object()) {
        throw MalformedPuzzle(std::string("puzzle record must be an object, got ") +
                              record.type_name());
    }

    Puzzle puzzle;
    puzzle.title = optional_string(record, "title", "puzzle");
    puzzle.author = optional_string(record, "author", "puzzle");

    const std::string difficulty = optional_string(record, "difficulty", "puzzle");
    if (!difficulty.empty()) {
        auto d = parse_difficulty(difficulty);
        if (!d) {
            throw MalformedPuzzle("puzzle: unknown difficulty '" + difficulty + "'");
        }
        puzzle.difficulty = *d;
    }

    puzzle.elements.actors = string_list(record, "actors");
    puzzle.elements.vectors = string_list(record, "vectors");
    puzzle.elements.assets = string_list(record, "assets");
    puzzle.elements.stolen_data = string_list(record, "stolen_data");

    const json& solution = member(record, "solution", "puzzle");
    if (!solution.is_object()) {
        throw MalformedPuzzle(std::string("solution: expected object, got ") +
                              solution.type_name());
    }
    puzzle.solution.triplet.actor = string_field(solution, "actor", "solution");
    puzzle.solution.triplet.vector = string_field(solution, "vector", "solution");
    puzzle.solution.triplet.asset = string_field(solution, "asset", "solution");
    puzzle.solution.stolen_data = string_field(solution, "stolen_data", "solution");

    const json& clues = member(record, "clues", "puzzle");
    if (!clues.is_array()) {
        throw MalformedPuzzle(std::string("puzzle: field 'clues' must be an array, got ") +
                              clues.type_name());
    }
    for (size_t i = 0; i < clues.size(); ++i) {
        puzzle.clues.push_back(read_clue(clues[i], i, puzzle.elements));
    }

    check_puzzle(puzzle);
    return puzzle;
}

Puzzle load_puzzle(const std::string& filename) {
    // ディレクトリも開けてしまうので先に弾く
    std::error_code ec;
    if (std::filesystem::is_directory(filename, ec)) {
        throw std::runtime_error("Cannot open file: " + filename + " is a directory");
    }
    std::ifstream in(filename);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    return parse_document(in, filename);
}

Puzzle parse_puzzle(const std::string& input) {
    std::istringstream in(input);
    return parse_document(in, "<string>");
}

json to_json(const ValidationResult& result, const std::string& file) {
    json j;
    if (!file.empty()) {
        j["file"] = file;
    }
    j["status"] = to_string(result.status);
    j["explanation"] = result.explanation;
    j["solution"] = result.solution ? solution_json(*result.solution) : json(nullptr);

    switch (result.status) {
        case ValidationStatus::SolutionMismatch:
            j["mismatch"] = to_string(result.mismatch);
            if (result.declared) {
                j["declared"] = solution_json(*result.declared);
            }
            break;
        case ValidationStatus::NotUnique:
            j["witnesses"] = json::array();
            for (const auto& w : result.witnesses) {
                j["witnesses"].push_back(triplet_json(w));
            }
            break;
        case ValidationStatus::Unsatisfiable:
            j["conflicting_clues"] = result.conflicting_clues;
            break;
        case ValidationStatus::Valid:
        case ValidationStatus::Malformed:
        case ValidationStatus::SolverTimeout:
            break;
    }
    return j;
}

void write_result(std::ostream& out, const ValidationResult& result, const std::string& file) {
    out << to_json(result, file).dump() << "\n";
}

} // namespace json
} // namespace spydirwebz
