/**
 * @file uniqueness.hpp
 * @brief 解の一意性証明（2回の check による判定）と全解列挙
 */
#ifndef SPYDIRWEBZ_UNIQUENESS_HPP
#define SPYDIRWEBZ_UNIQUENESS_HPP

#include "spydirwebz/formula.hpp"
#include "spydirwebz/sat_backend.hpp"
#include <functional>
#include <string>
#include <vector>

namespace spydirwebz {

/**
 * @brief 一意性判定の結果
 */
enum class Uniqueness {
    NoSolution,  // 充足不能
    Unique,      // ちょうど1つ
    Multiple,    // 2つ以上
    Unknown      // バックエンドが判定できなかった（タイムアウトなど）
};

struct UniquenessReport {
    Uniqueness verdict = Uniqueness::Unknown;
    std::vector<size_t> witnesses;          // 見つかった三つ組の変数インデックス（最大2つ）
    std::vector<size_t> conflicting_clues;  // NoSolution のときの矛盾した手がかり
    std::string reason;                     // Unknown のときの理由
    std::vector<CheckStatus> checks;        // 各 check() の結果（実行順）
    size_t check_count = 0;
};

/**
 * @brief 解がちょうど1つかを判定
 *
 * 1. check()。充足不能なら NoSolution
 * 2. 割当から真の三つ組 C1 を取り出す
 * 3. C1 をブロックして再度 check()
 * 4. 充足不能なら Unique、充足可能なら Multiple（C1, C2 を witness として返す）
 *
 * @param backend formula を読み込み済みのセッション
 * @param formula 三つ組の復元に使う論理式
 * @throws SolverError 割当が exactly-one を満たさない、またはブロックした解が再出現した場合
 */
UniquenessReport prove_uniqueness(SatBackend& backend, const Formula& formula);

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと列挙を継続、falseで停止
 */
using TripletCallback = std::function<bool(size_t var)>;

struct EnumerationResult {
    size_t count = 0;
    bool exhausted = false;  // 充足不能に達して全解を列挙し終えた
};

/**
 * @brief ブロッキングを繰り返して全解を列挙
 * @param backend formula を読み込み済みのセッション（ブロッキング節が追加される）
 * @param formula 三つ組の復元に使う論理式
 * @param callback 解が見つかるたびに呼ばれる（nullptr なら数えるだけ）
 */
EnumerationResult enumerate_solutions(SatBackend& backend, const Formula& formula,
                                      TripletCallback callback = nullptr);

} // namespace spydirwebz

#endif // SPYDIRWEBZ_UNIQUENESS_HPP
