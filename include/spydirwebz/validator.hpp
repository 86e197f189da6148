/**
 * @file validator.hpp
 * @brief パズル検証（一貫性・一意性・宣言された解との一致）
 */
#ifndef SPYDIRWEBZ_VALIDATOR_HPP
#define SPYDIRWEBZ_VALIDATOR_HPP

#include "spydirwebz/puzzle.hpp"
#include "spydirwebz/sat_backend.hpp"
#include "spydirwebz/uniqueness.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spydirwebz {

/**
 * @brief 検証結果の種類
 */
enum class ValidationStatus {
    Valid,             // 一貫していて一意に解け、宣言された解と一致
    Unsatisfiable,     // どの三つ組も全手がかりを満たさない
    NotUnique,         // 2つ以上の三つ組が全手がかりを満たす
    SolutionMismatch,  // 一意な解が宣言と異なる、またはデータが手がかりから導けない
    Malformed,         // 構造的不変条件の違反（バッチ処理で MalformedPuzzle から変換）
    SolverTimeout      // バックエンドが判定できなかった（結論なし）
};

/**
 * @brief レコード上の名前（"valid", "not_unique" など）
 */
std::string to_string(ValidationStatus status);

/**
 * @brief SolutionMismatch の理由
 */
enum class MismatchReason {
    None,
    Triplet,            // 三つ組が宣言と異なる
    DatumContradicted,  // 盗まれたデータが DataInference 手がかりと矛盾
    DatumUnsupported    // 盗まれたデータを導く手がかりがない
};

std::string to_string(MismatchReason reason);

/**
 * @brief 検証結果
 *
 * Puzzle への参照は持たない。
 */
struct ValidationResult {
    ValidationStatus status = ValidationStatus::Malformed;
    std::string explanation;
    std::optional<Solution> solution;       // ソルバーが導いた解（判定できた場合）
    std::optional<Solution> declared;       // SolutionMismatch のときの宣言された解
    MismatchReason mismatch = MismatchReason::None;
    std::vector<Triplet> witnesses;         // NotUnique のときの2つの三つ組
    std::vector<size_t> conflicting_clues;  // Unsatisfiable のときの手がかりインデックス（0始まり）

    bool is_valid() const { return status == ValidationStatus::Valid; }

    bool operator==(const ValidationResult& other) const;
    bool operator!=(const ValidationResult& other) const { return !(*this == other); }

    /**
     * @brief MalformedPuzzle を結果に変換（バッチ処理用）
     */
    static ValidationResult malformed(const std::string& message);
};

/**
 * @brief DataInference 手がかりの事後検査の結果
 */
struct DataInferenceCheck {
    MismatchReason verdict = MismatchReason::None;  // None なら宣言されたデータが一意に導かれる
    std::optional<std::string> implied_datum;       // 適用される手がかりが1種類のデータだけを指す場合
    std::vector<size_t> offending_clues;            // 矛盾した手がかりのインデックス
};

/**
 * @brief 真の vector に対して DataInference 手がかりを検査
 *
 * - vector が一致する手がかり (V, D) は D == 宣言データ を要求する
 * - vector が異なる手がかりが宣言データを指していれば矛盾（排他性）
 * - 適用される手がかりが1つもなければデータは導けない
 */
DataInferenceCheck check_data_inference(const Puzzle& puzzle, const std::string& true_vector);

/**
 * @brief 検証統計情報
 */
struct ValidatorStats {
    size_t variable_count = 0;
    size_t clause_count = 0;
    size_t check_count = 0;
    size_t solution_count = 0;   // count_solutions() で数えた解の数
};

/**
 * @brief パズル検証器
 *
 * validate() のたびに新しいバックエンドセッションを作る。
 * 1つの Validator を複数スレッドで共有してはならないが、
 * スレッドごとに Validator を持てば並列に検証できる。
 */
class Validator {
public:
    /**
     * @brief Z3 バックエンドを使う検証器
     */
    Validator();

    explicit Validator(BackendFactory factory);

    /**
     * @brief パズルを検証
     * @throws MalformedPuzzle 構造的不変条件の違反
     * @throws SolverError バックエンド障害（タイムアウトは結果として返す）
     */
    ValidationResult validate(const Puzzle& puzzle);

    /**
     * @brief 手がかりを満たす三つ組を全て数える
     * @throws MalformedPuzzle 構造的不変条件の違反
     */
    EnumerationResult count_solutions(const Puzzle& puzzle);

    /**
     * @brief 統計情報を取得（直前の呼び出し分）
     */
    const ValidatorStats& stats() const { return stats_; }

    /**
     * @brief check() 1回あたりの時間制限（ミリ秒、0 = 無制限）
     */
    void set_timeout_ms(unsigned timeout_ms) { timeout_ms_ = timeout_ms; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief バックエンドを差し替える
     */
    void set_backend_factory(BackendFactory factory) { factory_ = std::move(factory); }

private:
    /**
     * @brief 新しいセッションを作って論理式を読み込む
     */
    SatBackendPtr open_session(const Formula& formula);

    ValidationResult check_declared(const Puzzle& puzzle, const Triplet& found);

    BackendFactory factory_;
    unsigned timeout_ms_ = 0;
    bool verbose_ = false;
    ValidatorStats stats_;
};

} // namespace spydirwebz

#endif // SPYDIRWEBZ_VALIDATOR_HPP
