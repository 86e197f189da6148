/**
 * @file formula.hpp
 * @brief 三つ組指示変数上の CNF 論理式
 */
#ifndef SPYDIRWEBZ_FORMULA_HPP
#define SPYDIRWEBZ_FORMULA_HPP

#include "spydirwebz/puzzle.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spydirwebz {

/**
 * @brief 変数への完全割当（variable index -> 真偽値）
 */
using Assignment = std::vector<bool>;

/**
 * @brief リテラル（変数インデックスと極性のペア）
 */
struct Literal {
    size_t var;
    bool positive;

    bool operator==(const Literal& other) const {
        return var == other.var && positive == other.positive;
    }
};

/**
 * @brief 手がかりに由来しない節（exactly-one 構造）の由来値
 */
constexpr size_t structural_origin = SIZE_MAX;

/**
 * @brief 節（リテラルの選言）
 */
struct Clause {
    std::vector<Literal> literals;
    size_t origin = structural_origin;  // 生成元の手がかりインデックス
};

/**
 * @brief CNF 論理式
 *
 * 変数は Actors × Vectors × Assets の各三つ組に1つずつ割り当てる。
 * インデックスは (a * |V| + v) * |S| + s。
 * 要素名はコピーして保持するので、元の Puzzle への参照は残らない。
 */
class Formula {
public:
    explicit Formula(const ElementSet& elements);

    /**
     * @brief 変数の数（= 三つ組の数）
     */
    size_t variable_count() const {
        return actors_.size() * vectors_.size() * assets_.size();
    }

    /**
     * @brief 三つ組 (a, v, s) の変数インデックス
     */
    size_t var(size_t a, size_t v, size_t s) const {
        return (a * vectors_.size() + v) * assets_.size() + s;
    }

    /**
     * @brief 変数インデックスから三つ組を復元
     */
    Triplet triplet(size_t var) const;

    /**
     * @brief 三つ組の変数インデックスを検索
     * @return 要素が見つからなければ std::nullopt
     */
    std::optional<size_t> find(const Triplet& triplet) const;

    /**
     * @brief ソルバーに渡す変数名（"x_a_v_s"、要素名ではなくインデックス）
     */
    std::string variable_name(size_t var) const;

    std::optional<size_t> actor_index(const std::string& name) const;
    std::optional<size_t> vector_index(const std::string& name) const;
    std::optional<size_t> asset_index(const std::string& name) const;

    size_t actor_count() const { return actors_.size(); }
    size_t vector_count() const { return vectors_.size(); }
    size_t asset_count() const { return assets_.size(); }

    /**
     * @brief 節を追加
     * @param literals 選言するリテラル
     * @param origin 生成元の手がかりインデックス（構造なら structural_origin）
     */
    void add_clause(std::vector<Literal> literals, size_t origin = structural_origin);

    /**
     * @brief 節リストを取得
     */
    const std::vector<Clause>& clauses() const { return clauses_; }

    /**
     * @brief 割当が全ての節を満たすか
     */
    bool is_satisfied_by(const Assignment& assignment) const;

    /**
     * @brief 割当で真になっている変数のインデックス（昇順）
     */
    std::vector<size_t> true_variables(const Assignment& assignment) const;

    /**
     * @brief 三つ組 var だけが真である割当
     */
    Assignment one_hot(size_t var) const;

private:
    std::vector<std::string> actors_;
    std::vector<std::string> vectors_;
    std::vector<std::string> assets_;
    std::vector<Clause> clauses_;
};

} // namespace spydirwebz

#endif // SPYDIRWEBZ_FORMULA_HPP
