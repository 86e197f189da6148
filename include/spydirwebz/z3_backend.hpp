/**
 * @file z3_backend.hpp
 * @brief Z3 による SatBackend 実装（ブール理論のみ使用）
 */
#ifndef SPYDIRWEBZ_Z3_BACKEND_HPP
#define SPYDIRWEBZ_Z3_BACKEND_HPP

#include "spydirwebz/sat_backend.hpp"
#include <z3++.h>
#include <map>
#include <string>
#include <vector>

namespace spydirwebz {

/**
 * @brief Z3 バックエンド
 *
 * 構造節とブロッキング節は直接 assert する。
 * 手がかりの節は追跡リテラル t_i を用いて t_i => clause として追加し、
 * check() では全ての t_i を仮定として渡す。
 * 充足不能なら unsat core に含まれる t_i が矛盾した手がかりを示す。
 *
 * 各インスタンスは自分の z3::context を持つので、
 * インスタンスごとに別スレッドで使ってよい。
 */
class Z3Backend : public SatBackend {
public:
    Z3Backend();

    std::string name() const override;
    void add_formula(const Formula& formula) override;
    CheckResult check() override;
    void block(const Assignment& assignment) override;
    std::vector<size_t> conflicting_origins() const override;
    void set_timeout(unsigned timeout_ms) override;

    /**
     * @brief assert 済みの式の数（統計用）
     */
    size_t assertion_count() const;

private:
    /**
     * @brief 手がかり i の追跡リテラルを取得（なければ作成）
     */
    z3::expr tracker(size_t origin);

    z3::expr to_z3(const Clause& clause);

    z3::context ctx_;
    z3::solver solver_;
    std::vector<z3::expr> vars_;
    z3::expr_vector trackers_;
    std::map<size_t, size_t> origin_to_tracker_;  // 手がかり -> trackers_ 内の位置
    std::map<std::string, size_t> tracker_origin_;  // 追跡リテラル名 -> 手がかり
    std::vector<size_t> last_core_;
};

/**
 * @brief Z3Backend を作るファクトリ
 */
BackendFactory z3_backend_factory();

} // namespace spydirwebz

#endif // SPYDIRWEBZ_Z3_BACKEND_HPP
