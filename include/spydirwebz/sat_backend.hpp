/**
 * @file sat_backend.hpp
 * @brief 充足可能性判定バックエンドの抽象インターフェース
 */
#ifndef SPYDIRWEBZ_SAT_BACKEND_HPP
#define SPYDIRWEBZ_SAT_BACKEND_HPP

#include "spydirwebz/formula.hpp"
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace spydirwebz {

/**
 * @brief check() の結果
 */
enum class CheckStatus {
    Satisfiable,    // 充足可能（assignment が有効）
    Unsatisfiable,  // 充足不能
    Unknown         // 資源制限（タイムアウトなど）で判定できず
};

struct CheckResult {
    CheckStatus status = CheckStatus::Unknown;
    Assignment assignment;  // Satisfiable のときのみ
    std::string reason;     // Unknown のときの理由
};

/**
 * @brief 資源制限以外のバックエンド障害
 */
class SolverError : public std::runtime_error {
public:
    explicit SolverError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief SAT バックエンド（1セッション = 1インスタンス）
 *
 * 追加した制約はセッションの寿命の間ずっと有効。
 * 複数スレッドから同じインスタンスを使ってはならない。
 */
class SatBackend {
public:
    virtual ~SatBackend() = default;

    /**
     * @brief バックエンド名
     */
    virtual std::string name() const = 0;

    /**
     * @brief 論理式の全ての節を追加
     *
     * 手がかり由来の節は origin ごとにまとめて追跡し、
     * 充足不能時に conflicting_origins() で報告できるようにする。
     */
    virtual void add_formula(const Formula& formula) = 0;

    /**
     * @brief 充足可能性を判定
     * @throws SolverError バックエンド内部のエラー
     */
    virtual CheckResult check() = 0;

    /**
     * @brief 割当の否定を節として追加（ブロッキング節）
     * @param assignment 決定変数（三つ組指示変数）全体への割当
     */
    virtual void block(const Assignment& assignment) = 0;

    /**
     * @brief 直前の check() が Unsatisfiable のとき、矛盾に関わった手がかり
     *
     * コアを計算できないバックエンドは空を返す。
     * @return 手がかりインデックス（昇順、重複なし）
     */
    virtual std::vector<size_t> conflicting_origins() const = 0;

    /**
     * @brief check() 1回あたりの時間制限（ミリ秒、0 = 無制限）
     */
    virtual void set_timeout(unsigned timeout_ms) = 0;
};

using SatBackendPtr = std::unique_ptr<SatBackend>;

/**
 * @brief 検証1回ごとに新しいセッションを作るファクトリ
 */
using BackendFactory = std::function<SatBackendPtr()>;

} // namespace spydirwebz

#endif // SPYDIRWEBZ_SAT_BACKEND_HPP
