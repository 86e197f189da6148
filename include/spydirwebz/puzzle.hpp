/**
 * @file puzzle.hpp
 * @brief パズルのドメインモデル（要素集合・手がかり・解）
 */
#ifndef SPYDIRWEBZ_PUZZLE_HPP
#define SPYDIRWEBZ_PUZZLE_HPP

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace spydirwebz {

/**
 * @brief 各カテゴリの要素数の下限・上限
 */
constexpr size_t min_elements = 3;
constexpr size_t max_elements = 6;

/**
 * @brief 構造的不変条件の違反（要素数、重複、存在しない要素の参照）
 */
class MalformedPuzzle : public std::runtime_error {
public:
    explicit MalformedPuzzle(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief 難易度
 */
enum class Difficulty {
    Easy,
    Medium,
    Impossible
};

std::string to_string(Difficulty difficulty);

/**
 * @brief 文字列から難易度を解決
 * @return 未知の文字列なら std::nullopt
 */
std::optional<Difficulty> parse_difficulty(const std::string& name);

/**
 * @brief 要素集合（4カテゴリ、各カテゴリ内で重複なし）
 */
struct ElementSet {
    std::vector<std::string> actors;
    std::vector<std::string> vectors;
    std::vector<std::string> assets;
    std::vector<std::string> stolen_data;
};

/**
 * @brief (Actor, Vector, Asset) の組
 */
struct Triplet {
    std::string actor;
    std::string vector;
    std::string asset;

    bool operator==(const Triplet& other) const {
        return actor == other.actor && vector == other.vector && asset == other.asset;
    }
    bool operator!=(const Triplet& other) const { return !(*this == other); }
};

std::string to_string(const Triplet& triplet);

/**
 * @brief 解: 三つ組 + 盗まれたデータ
 */
struct Solution {
    Triplet triplet;
    std::string stolen_data;

    bool operator==(const Solution& other) const {
        return triplet == other.triplet && stolen_data == other.stolen_data;
    }
    bool operator!=(const Solution& other) const { return !(*this == other); }
};

// ============================================================================
// Clues
// ============================================================================

/**
 * @brief 「{actor} は {vector} を使わなかった」
 */
struct NegationClue {
    std::string actor;
    std::string vector;
};

/**
 * @brief 「{vector} は {asset} に対して使われた」
 */
struct AffirmativeClue {
    std::string vector;
    std::string asset;
};

/**
 * @brief 「{vector} を使ったアクターは {asset} にアクセスしなかった」
 */
struct RelationalClue {
    std::string vector;
    std::string asset;
};

/**
 * @brief 「{actor} が {vector} を使ったなら {asset} にアクセスした」
 */
struct ConditionalClue {
    std::string actor;
    std::string vector;
    std::string asset;
};

/**
 * @brief 「{data} が盗まれたのは {vector} を使った攻撃だけ」
 *
 * 三つ組の変数には現れない。解が確定した後に検査する。
 */
struct DataInferenceClue {
    std::string vector;
    std::string data;
};

/**
 * @brief 手がかり（閉じた直和型）
 *
 * 種類を追加すると std::visit する全ての箇所がコンパイルエラーになる。
 */
using Clue = std::variant<
    NegationClue,
    AffirmativeClue,
    RelationalClue,
    ConditionalClue,
    DataInferenceClue
>;

/**
 * @brief 手がかりの種類（Clue の index と同じ順序）
 */
enum class ClueKind {
    Negation,
    Affirmative,
    Relational,
    Conditional,
    DataInference
};

ClueKind kind_of(const Clue& clue);

/**
 * @brief レコード上の種類名（"negation", "data-inference" など）
 */
std::string to_string(ClueKind kind);

/**
 * @brief 種類名から ClueKind を解決
 * @return 未知の名前なら std::nullopt
 */
std::optional<ClueKind> parse_clue_kind(const std::string& name);

/**
 * @brief 手がかりを正規の英文に変換
 *
 * 例: "GhostShell did not use SQL Injection."
 */
std::string clue_text(const Clue& clue);

/**
 * @brief 英文から手がかりを復元
 *
 * 要素名に空白を含んでもよいように、既知の要素の組み合わせで
 * テンプレートを展開して照合する。
 *
 * @param kind 手がかりの種類
 * @param text 英文（前後の空白は無視）
 * @param elements 照合に使う要素集合
 * @return 一致する組み合わせがなければ std::nullopt
 */
std::optional<Clue> parse_clue_text(ClueKind kind, const std::string& text,
                                    const ElementSet& elements);

// ============================================================================
// Puzzle
// ============================================================================

/**
 * @brief パズル全体
 *
 * 外部（作成ツールやジェネレータ）が一括で構築し、以後変更しない。
 */
struct Puzzle {
    std::string title;
    std::string author;
    Difficulty difficulty = Difficulty::Easy;
    ElementSet elements;
    std::vector<Clue> clues;
    Solution solution;
};

/**
 * @brief 構造的不変条件を検査
 *
 * - 各カテゴリの要素数が min_elements..max_elements
 * - カテゴリ内に重複がない
 * - 手がかりと解が参照する要素が全て存在する
 *
 * @throws MalformedPuzzle 違反があった場合（最初の違反を報告）
 */
void check_puzzle(const Puzzle& puzzle);

} // namespace spydirwebz

#endif // SPYDIRWEBZ_PUZZLE_HPP
