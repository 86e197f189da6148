/**
 * @file encoder.hpp
 * @brief パズルを CNF 論理式に変換する
 */
#ifndef SPYDIRWEBZ_ENCODER_HPP
#define SPYDIRWEBZ_ENCODER_HPP

#include "spydirwebz/formula.hpp"
#include "spydirwebz/puzzle.hpp"

namespace spydirwebz {

/**
 * @brief パズル全体を論理式に変換
 *
 * exactly-one 制約と全ての手がかりの節の連言を返す。
 * 同じ Puzzle に対しては常に同じ節列を返す。
 *
 * @throws MalformedPuzzle 手がかりが存在しない要素を参照している場合
 */
Formula encode(const Puzzle& puzzle);

/**
 * @brief exactly-one 制約を追加
 *
 * 全変数の選言（少なくとも1つ）と、異なる変数の各ペアについて
 * ¬x ∨ ¬y（高々1つ）。
 */
void add_exactly_one(Formula& formula);

/**
 * @brief 1つの手がかりの節を追加
 *
 * DataInference は三つ組変数を制約しないので節を追加しない。
 *
 * @param formula 追加先
 * @param clue 手がかり
 * @param origin 節に記録する手がかりインデックス
 */
void encode_clue(Formula& formula, const Clue& clue, size_t origin);

} // namespace spydirwebz

#endif // SPYDIRWEBZ_ENCODER_HPP
