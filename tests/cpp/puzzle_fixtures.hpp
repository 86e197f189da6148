/**
 * @file puzzle_fixtures.hpp
 * @brief テスト用のパズル
 */
#ifndef SPYDIRWEBZ_TESTS_PUZZLE_FIXTURES_HPP
#define SPYDIRWEBZ_TESTS_PUZZLE_FIXTURES_HPP

#include "spydirwebz/puzzle.hpp"

namespace spydirwebz {
namespace testing {

/**
 * @brief 3x3x3 の要素集合（A,B,C / X,Y,Z / P,Q,R / D1,D2,D3）
 */
inline ElementSet small_elements() {
    ElementSet e;
    e.actors = {"A", "B", "C"};
    e.vectors = {"X", "Y", "Z"};
    e.assets = {"P", "Q", "R"};
    e.stolen_data = {"D1", "D2", "D3"};
    return e;
}

/**
 * @brief 手がかりなしのパズル（宣言解は (A, X, P) / D1）
 */
inline Puzzle blank_puzzle() {
    Puzzle p;
    p.title = "Blank";
    p.author = "tests";
    p.elements = small_elements();
    p.solution = Solution{Triplet{"A", "X", "P"}, "D1"};
    return p;
}

/**
 * @brief 一意に (A, X, P) / D1 と決まる妥当なパズル
 *
 * clue 0-5: B と C はどの vector も使っていない
 * clue 6:   X は P に対して使われた
 * clue 7:   X を使った攻撃だけが D1 を盗んだ
 */
inline Puzzle valid_puzzle() {
    Puzzle p = blank_puzzle();
    p.title = "Valid";
    for (const char* actor : {"B", "C"}) {
        for (const char* vector : {"X", "Y", "Z"}) {
            p.clues.push_back(NegationClue{actor, vector});
        }
    }
    p.clues.push_back(AffirmativeClue{"X", "P"});
    p.clues.push_back(DataInferenceClue{"X", "D1"});
    return p;
}

} // namespace testing
} // namespace spydirwebz

#endif // SPYDIRWEBZ_TESTS_PUZZLE_FIXTURES_HPP
